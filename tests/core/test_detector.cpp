#include "pyspot/core/detector.hpp"
#include <gtest/gtest.h>

namespace pyspot {

class DetectorTest : public ::testing::Test {
protected:
    Detector detector_;
};

TEST_F(DetectorTest, FunctionSnippetIsWrappedWhole)
{
    auto result = detector_.detect("def greet():\n    print('Hello')");

    EXPECT_EQ(result.text, "<PythonCode>def greet():\n    print('Hello')</PythonCode>");
    EXPECT_DOUBLE_EQ(result.confidence, 100.0);
    EXPECT_TRUE(result.python_detected);
}

TEST_F(DetectorTest, PlainProseIsUnchanged)
{
    auto result = detector_.detect("I like this and that");

    EXPECT_EQ(result.text, "I like this and that");
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_FALSE(result.python_detected);
    EXPECT_FALSE(result.dangerous);
}

TEST_F(DetectorTest, DangerFlagDoesNotDriveWrapping)
{
    auto result = detector_.detect("os.system('rm -rf /')");

    EXPECT_TRUE(result.dangerous);
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_EQ(result.text, "os.system('rm -rf /')");
}

TEST_F(DetectorTest, DangerousCallInProseIsFlaggedButNeverWrapped)
{
    auto result = detector_.detect("We should never call eval(x) in prose.");

    EXPECT_TRUE(result.dangerous);
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_FALSE(result.python_detected);
    EXPECT_EQ(result.text, "We should never call eval(x) in prose.");
}

TEST_F(DetectorTest, DetectingTwiceNeverDoubleWraps)
{
    auto first = detector_.detect("Notes first\nimport os\nprint(os.name)\nthanks\n");
    ASSERT_EQ(first.text, "Notes first\n<PythonCode>import os\nprint(os.name)\n</PythonCode>thanks\n");

    auto second = detector_.detect(first.text);

    EXPECT_EQ(second.text, first.text);
    EXPECT_FALSE(second.python_detected);
    EXPECT_LE(second.confidence, first.confidence);
}

TEST_F(DetectorTest, RevertedTextEqualsInput)
{
    Detector strict(DetectorOptions{.threshold = 90.0});
    const std::string input = "import os\nhello there\nimport sys\nmore prose\ndef f():\n    return 1\n";

    auto result = strict.detect(input);

    EXPECT_EQ(result.text, input);
    EXPECT_TRUE(result.reverted);
    EXPECT_FALSE(result.python_detected);
}

TEST_F(DetectorTest, MegabyteLinesStayWithinSizeCap)
{
    const std::string header = "if " + std::string(1'000'000, 'a') + ":";
    auto wrapped = detector_.detect(header);

    EXPECT_EQ(wrapped.text, "<PythonCode>" + header + "</PythonCode>");
    EXPECT_DOUBLE_EQ(wrapped.confidence, 80.0);

    const std::string gap = "hello rm" + std::string(1'000'000, ' ') + "x";
    auto plain = detector_.detect(gap);

    EXPECT_EQ(plain.text, gap);
    EXPECT_FALSE(plain.dangerous);
}

TEST_F(DetectorTest, CustomTagsPerCall)
{
    auto result = detector_.detect("import os", "[py]", "[/py]");

    EXPECT_EQ(result.text, "[py]import os[/py]");
}

TEST_F(DetectorTest, ThresholdIsClamped)
{
    Detector high(DetectorOptions{.threshold = 150.0});
    Detector low(DetectorOptions{.threshold = -5.0});

    EXPECT_DOUBLE_EQ(high.options().threshold, 100.0);
    EXPECT_DOUBLE_EQ(low.options().threshold, 0.0);
}

TEST_F(DetectorTest, SizeCapBoundary)
{
    Detector capped(DetectorOptions{.max_input_size = 16});

    EXPECT_NO_THROW(capped.detect(std::string(15, 'a')));
    EXPECT_NO_THROW(capped.detect(std::string(16, 'a')));
    EXPECT_THROW(capped.detect(std::string(17, 'a')), OversizeInputError);
    EXPECT_THROW(capped.detect_json("[\"" + std::string(20, 'a') + "\"]"), OversizeInputError);
}

TEST_F(DetectorTest, OversizeErrorCarriesSizes)
{
    Detector capped(DetectorOptions{.max_input_size = 4});

    try {
        capped.detect("import os");
        FAIL() << "expected OversizeInputError";
    } catch (const OversizeInputError& e) {
        EXPECT_EQ(e.size(), 9U);
        EXPECT_EQ(e.limit(), 4U);
    }
}

TEST_F(DetectorTest, JsonWithoutCodeIsReturnedVerbatim)
{
    const std::string document = R"({"a": "x = 1", "b": "hello world"})";

    auto result = detector_.detect_json(document);

    EXPECT_EQ(result.document, document);
    EXPECT_TRUE(result.confidences.empty());
    EXPECT_FALSE(result.changed);
    EXPECT_FALSE(result.python_detected);
}

TEST_F(DetectorTest, JsonShortFieldIsNeverScored)
{
    auto result = detector_.detect_json(R"({"a": "def"})");

    EXPECT_EQ(result.document, R"({"a": "def"})");
    EXPECT_TRUE(result.confidences.empty());
}

TEST_F(DetectorTest, JsonStringFieldIsWrappedInKeyOrder)
{
    auto result = detector_.detect_json(R"json({"msg": "Here:\nimport os\nprint(1)", "n": 3})json");

    EXPECT_EQ(result.document, R"({"msg":"Here:\\n<PythonCode>import os\\nprint(1)</PythonCode>","n":3})");
    EXPECT_TRUE(result.python_detected);
    EXPECT_TRUE(result.changed);
    EXPECT_EQ(result.confidences, std::vector<double>{100.0});
}

TEST_F(DetectorTest, JsonKeepsUtf8Unescaped)
{
    auto result = detector_.detect_json(R"({"note":"naïve café","code":"import os"})");

    EXPECT_EQ(result.document, R"({"note":"naïve café","code":"<PythonCode>import os</PythonCode>"})");
}

TEST_F(DetectorTest, JsonLowMeanReturnsOriginalDocument)
{
    Detector strict(DetectorOptions{.threshold = 90.0});
    const std::string document = R"({"a": "import os", "b": "import sys", "c": "def f():\n    return 1"})";

    auto result = strict.detect_json(document);

    EXPECT_EQ(result.document, document);
    EXPECT_TRUE(result.reverted);
    EXPECT_FALSE(result.python_detected);
    EXPECT_EQ(result.confidences, (std::vector<double>{80.0, 80.0, 100.0}));
}

TEST_F(DetectorTest, ParallelAndSequentialJsonAreIdentical)
{
    std::string document = "[";
    for (int i = 0; i < 24; ++i) {
        if (i > 0) {
            document += ",";
        }
        document += i % 3 == 0 ? R"("import module_)" + std::to_string(i) + "\""
                  : i % 3 == 1 ? R"({"text": "just some words", "id": )" + std::to_string(i) + "}"
                               : R"(["def f():\n    return 1", null, true])";
    }
    document += "]";

    auto sequential = detector_.detect_json(document, "<PythonCode>", "</PythonCode>", false);
    auto parallel = detector_.detect_json(document, "<PythonCode>", "</PythonCode>", true);

    EXPECT_EQ(parallel.document, sequential.document);
    EXPECT_EQ(parallel.confidences, sequential.confidences);
    EXPECT_TRUE(parallel.python_detected);
}

TEST_F(DetectorTest, MalformedJsonIsRefused)
{
    EXPECT_THROW(detector_.detect_json("{\"a\": "), MalformedJsonError);
    EXPECT_THROW(detector_.detect_json(""), MalformedJsonError);
}

TEST_F(DetectorTest, OverflowingNumberIsRefusedAsMalformed)
{
    EXPECT_THROW(detector_.detect_json(R"({"a":1e400})"), MalformedJsonError);
    EXPECT_THROW(detector_.detect_json(R"([1, "import os", -1e400])"), DetectorError);
}

TEST_F(DetectorTest, DeepJsonIsRefused)
{
    Detector shallow(DetectorOptions{.max_depth = 2});

    EXPECT_NO_THROW(shallow.detect_json("[[1]]"));
    EXPECT_THROW(shallow.detect_json("[[[1]]]"), NestingTooDeepError);
}

TEST_F(DetectorTest, ErrorsShareBaseType)
{
    EXPECT_THROW(detector_.detect_json("not json"), DetectorError);
}

TEST_F(DetectorTest, FindDangerousPatterns)
{
    auto matches = detector_.find_dangerous_patterns("import pickle\npickle.load(f)");

    ASSERT_EQ(matches.size(), 1U);
    EXPECT_EQ(matches[0].pattern_name, "pickle");
    EXPECT_EQ(matches[0].matched_text, "pickle.load");
}

} // namespace pyspot
