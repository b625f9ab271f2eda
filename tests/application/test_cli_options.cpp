#include "pyspot/application/cli_options.hpp"
#include <gtest/gtest.h>

namespace pyspot {

TEST(CliOptionsTest, NoArgumentsGiveDefaults)
{
    auto parsed = parse_args({});

    ASSERT_EQ(parsed.status, ParseStatus::OK);
    EXPECT_EQ(parsed.config.input_file, "-");
    EXPECT_EQ(parsed.config.output_file, "-");
    EXPECT_FALSE(parsed.config.json_mode);
    EXPECT_FALSE(parsed.config.interactive);
    EXPECT_FALSE(parsed.config.fail_on_danger);
    EXPECT_EQ(parsed.config.detector.start_tag, "<PythonCode>");
    EXPECT_EQ(parsed.config.detector.end_tag, "</PythonCode>");
    EXPECT_DOUBLE_EQ(parsed.config.detector.threshold, 70.0);
    EXPECT_EQ(parsed.config.detector.max_workers, 4U);
}

TEST(CliOptionsTest, AllOptionsAreApplied)
{
    auto parsed = parse_args({"-i", "in.json", "--output", "out.json", "--json", "--parallel",
                              "--threshold", "55.5", "--start-tag", "[py]", "--end-tag", "[/py]",
                              "--max-size", "1024", "--workers", "8", "--verbose", "--report",
                              "--fail-on-danger"});

    ASSERT_EQ(parsed.status, ParseStatus::OK) << parsed.error;
    const auto& config = parsed.config;
    EXPECT_EQ(config.input_file, "in.json");
    EXPECT_EQ(config.output_file, "out.json");
    EXPECT_TRUE(config.json_mode);
    EXPECT_TRUE(config.detector.parallel);
    EXPECT_DOUBLE_EQ(config.detector.threshold, 55.5);
    EXPECT_EQ(config.detector.start_tag, "[py]");
    EXPECT_EQ(config.detector.end_tag, "[/py]");
    EXPECT_EQ(config.detector.max_input_size, 1024U);
    EXPECT_EQ(config.detector.max_workers, 8U);
    EXPECT_TRUE(config.verbose);
    EXPECT_TRUE(config.report);
    EXPECT_TRUE(config.fail_on_danger);
}

TEST(CliOptionsTest, EscapedNewlinesInTagsAreDecoded)
{
    auto parsed = parse_args({"--start-tag", "```python\\n", "--end-tag", "\\n```"});

    ASSERT_EQ(parsed.status, ParseStatus::OK);
    EXPECT_EQ(parsed.config.detector.start_tag, "```python\n");
    EXPECT_EQ(parsed.config.detector.end_tag, "\n```");
}

TEST(CliOptionsTest, HelpStopsParsing)
{
    EXPECT_EQ(parse_args({"--help"}).status, ParseStatus::HELP);
    EXPECT_EQ(parse_args({"--json", "-h", "--bogus"}).status, ParseStatus::HELP);
}

TEST(CliOptionsTest, InvalidArgumentsAreReported)
{
    struct Case {
        std::vector<std::string> args;
        std::string error;
    };
    std::vector<Case> cases = {
        {{"--threshold"}, "missing value for --threshold"},
        {{"--threshold", "high"}, "invalid threshold 'high'"},
        {{"--threshold", "50%"}, "invalid threshold '50%'"},
        {{"--max-size", "-5"}, "invalid size '-5'"},
        {{"--workers", "0"}, "invalid worker count '0'"},
        {{"--frobnicate"}, "unknown option --frobnicate"},
        {{"--start-tag", ""}, "tags must not be empty"},
    };

    for (const auto& c : cases) {
        SCOPED_TRACE(c.error);
        auto parsed = parse_args(c.args);
        EXPECT_EQ(parsed.status, ParseStatus::ERROR);
        EXPECT_EQ(parsed.error, c.error);
    }
}

TEST(CliOptionsTest, UsageListsEveryOption)
{
    auto usage = usage_text();
    for (const std::string option : {"--input", "--output", "--json", "--parallel", "--threshold",
                                     "--start-tag", "--end-tag", "--max-size", "--workers",
                                     "--interactive", "--verbose", "--report", "--fail-on-danger",
                                     "--help"}) {
        EXPECT_NE(usage.find(option), std::string::npos) << option;
    }
}

} // namespace pyspot
