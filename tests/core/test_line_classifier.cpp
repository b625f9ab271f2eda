#include "pyspot/core/line_classifier.hpp"
#include <gtest/gtest.h>

namespace pyspot {

class LineClassifierTest : public ::testing::Test {
protected:
    LineClassifier classifier_{std::make_shared<const KeywordTables>(KeywordTables::python())};
};

TEST_F(LineClassifierTest, StrongKeywordMakesLineCodeLike)
{
    EXPECT_TRUE(classifier_.is_line_code_like("import os"));
    EXPECT_TRUE(classifier_.is_line_code_like("    return value"));
    EXPECT_TRUE(classifier_.is_line_code_like("print(total)"));
}

TEST_F(LineClassifierTest, BlockHeaderIsCodeLike)
{
    EXPECT_TRUE(classifier_.is_line_code_like("  for item in items:"));
    // finally is a header keyword but not a strong keyword
    EXPECT_TRUE(classifier_.is_line_code_like("finally:"));
}

TEST_F(LineClassifierTest, HeaderKeywordMustBeWholeFirstWord)
{
    EXPECT_TRUE(classifier_.is_line_code_like("if(x):"));
    EXPECT_TRUE(classifier_.is_line_code_like("else:  # otherwise"));
    EXPECT_FALSE(classifier_.is_line_code_like("iffy stuff:"));
    EXPECT_FALSE(classifier_.is_line_code_like("forward planning:"));
}

TEST_F(LineClassifierTest, VeryLongHeaderLineIsClassified)
{
    const std::string line = "if " + std::string(1'000'000, 'a') + ":";

    EXPECT_TRUE(classifier_.is_line_code_like(line));
    EXPECT_FALSE(classifier_.is_line_code_like("hello " + std::string(1'000'000, ' ') + "there:"));
}

TEST_F(LineClassifierTest, ShortLinesAreRejected)
{
    EXPECT_FALSE(classifier_.is_line_code_like("if"));
    EXPECT_FALSE(classifier_.is_line_code_like("   "));
}

TEST_F(LineClassifierTest, CommentsAreIgnored)
{
    EXPECT_FALSE(classifier_.is_line_code_like("# import os"));
    EXPECT_FALSE(classifier_.is_line_code_like("x = 1  # import os"));
    EXPECT_TRUE(classifier_.is_line_code_like("import os  # for paths"));
}

TEST_F(LineClassifierTest, ForeignLanguageSignalsVetoEverything)
{
    EXPECT_FALSE(classifier_.is_line_code_like("function foo() { return 1; }"));
    EXPECT_FALSE(classifier_.is_line_code_like("if (x) { run(); }"));
    EXPECT_FALSE(classifier_.is_line_code_like("console.log('print')"));
    EXPECT_FALSE(classifier_.is_line_code_like("return x;"));
}

TEST_F(LineClassifierTest, WeakKeywordsAloneNeverQualify)
{
    EXPECT_FALSE(classifier_.is_line_code_like("this is and not that"));
}

TEST_F(LineClassifierTest, KeywordsAreCaseSensitivePerLine)
{
    EXPECT_FALSE(classifier_.is_line_code_like("Import the data first"));
}

TEST_F(LineClassifierTest, PrefilterLowercasesBeforeMatching)
{
    EXPECT_TRUE(classifier_.might_contain_code("We IMPORT stuff"));
    EXPECT_FALSE(classifier_.might_contain_code("hello world"));
    EXPECT_FALSE(classifier_.might_contain_code("x = 1"));
}

TEST_F(LineClassifierTest, PrefilterNeedsStrongKeywordEvenForForeignText)
{
    EXPECT_TRUE(classifier_.might_contain_code("function f() { return 1; }"));
    EXPECT_FALSE(classifier_.might_contain_code("console.log(x);"));
}

TEST_F(LineClassifierTest, HasStrongKeyword)
{
    EXPECT_TRUE(classifier_.has_strong_keyword({"x", "yield"}));
    EXPECT_FALSE(classifier_.has_strong_keyword({"in", "is", "not"}));
}

} // namespace pyspot
