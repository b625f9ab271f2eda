#include "pyspot/core/confidence_scorer.hpp"
#include "pyspot/parsers/python_syntax_checker.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace pyspot {

class MockSyntaxChecker : public ISyntaxChecker {
public:
    MOCK_METHOD(SyntaxCheckResult, check, (const std::string&), (const, override));
};

class ConfidenceScorerTest : public ::testing::Test {
protected:
    LineClassifier classifier_{std::make_shared<const KeywordTables>(KeywordTables::python())};
    ConfidenceScorer scorer_{classifier_, std::make_shared<const PythonSyntaxChecker>()};
};

TEST_F(ConfidenceScorerTest, ValidMultiLineBlockScoresFull)
{
    EXPECT_DOUBLE_EQ(scorer_.score_block("def greet():\n    print('Hello')\n"), kMultiLineConfidence);
}

TEST_F(ConfidenceScorerTest, ValidSingleLineBlockScoresSingleLine)
{
    EXPECT_DOUBLE_EQ(scorer_.score_block("import os\n"), kSingleLineConfidence);
}

TEST_F(ConfidenceScorerTest, CommentOnlyBlockScoresZero)
{
    EXPECT_DOUBLE_EQ(scorer_.score_block("# only a comment\n\n"), kNoConfidence);
}

TEST_F(ConfidenceScorerTest, SuccessfulParseScoresWithoutKeywords)
{
    EXPECT_DOUBLE_EQ(scorer_.score_block("x = 1"), kSingleLineConfidence);
}

TEST_F(ConfidenceScorerTest, FailedParseFallsBackToKeywords)
{
    EXPECT_DOUBLE_EQ(scorer_.score_block("print 'hello'"), kSingleLineConfidence);
    EXPECT_DOUBLE_EQ(scorer_.score_block("hello there friend\nand more"), kNoConfidence);
}

TEST_F(ConfidenceScorerTest, IndentedSnippetIsDedentedBeforeParsing)
{
    EXPECT_DOUBLE_EQ(scorer_.score_block("    if x:\n        y = 2\n"), kMultiLineConfidence);
}

TEST_F(ConfidenceScorerTest, CheckerReceivesDedentedCodeLines)
{
    auto checker = std::make_shared<MockSyntaxChecker>();
    ConfidenceScorer scorer(classifier_, checker);

    EXPECT_CALL(*checker, check(std::string("a = 1  \nif a:\n    b = 2")))
        .WillOnce(::testing::Return(SyntaxCheckResult{.valid = true}));

    EXPECT_DOUBLE_EQ(scorer.score_block("    a = 1  # set\n\n    if a:\n        b = 2\n"), kMultiLineConfidence);
}

TEST_F(ConfidenceScorerTest, RejectingCheckerLeavesOnlyKeywordFallback)
{
    auto checker = std::make_shared<MockSyntaxChecker>();
    ConfidenceScorer scorer(classifier_, checker);

    EXPECT_CALL(*checker, check(::testing::_))
        .WillRepeatedly(::testing::Return(SyntaxCheckResult{.valid = false, .message = "invalid syntax", .line = 1}));

    EXPECT_DOUBLE_EQ(scorer.score_block("import os\nimport sys"), kMultiLineConfidence);
    EXPECT_DOUBLE_EQ(scorer.score_block("total = 1"), kNoConfidence);
    // Keywords inside comments do not count
    EXPECT_DOUBLE_EQ(scorer.score_block("total = 1  # return"), kNoConfidence);
}

} // namespace pyspot
