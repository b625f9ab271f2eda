#include "pyspot/parsers/python_tokenizer.hpp"
#include <gtest/gtest.h>

namespace pyspot {

namespace {

auto kinds_of(const std::vector<Token>& tokens) -> std::vector<TokenKind> {
    std::vector<TokenKind> kinds;
    for (const auto& token : tokens) {
        kinds.push_back(token.kind);
    }
    return kinds;
}

auto tokenize(std::string_view source) -> std::vector<Token> {
    return PythonTokenizer(source).tokenize();
}

} // namespace

TEST(PythonTokenizerTest, SimpleAssignment)
{
    auto tokens = tokenize("x = 1\n");

    std::vector<TokenKind> expected = {TokenKind::NAME, TokenKind::OP, TokenKind::NUMBER,
                                       TokenKind::NEWLINE, TokenKind::END};
    EXPECT_EQ(kinds_of(tokens), expected);
    EXPECT_EQ(tokens[0].text, "x");
    EXPECT_EQ(tokens[1].text, "=");
}

TEST(PythonTokenizerTest, MissingFinalNewlineIsSupplied)
{
    auto tokens = tokenize("pass");

    std::vector<TokenKind> expected = {TokenKind::NAME, TokenKind::NEWLINE, TokenKind::END};
    EXPECT_EQ(kinds_of(tokens), expected);
}

TEST(PythonTokenizerTest, IndentationProducesIndentAndDedent)
{
    auto tokens = tokenize("if x:\n    y\n");

    std::vector<TokenKind> expected = {
        TokenKind::NAME, TokenKind::NAME, TokenKind::OP, TokenKind::NEWLINE,
        TokenKind::INDENT, TokenKind::NAME, TokenKind::NEWLINE,
        TokenKind::DEDENT, TokenKind::END
    };
    EXPECT_EQ(kinds_of(tokens), expected);
}

TEST(PythonTokenizerTest, BracketsJoinLines)
{
    auto tokens = tokenize("f(1,\n  2)\n");

    std::vector<TokenKind> expected = {
        TokenKind::NAME, TokenKind::OP, TokenKind::NUMBER, TokenKind::OP,
        TokenKind::NUMBER, TokenKind::OP, TokenKind::NEWLINE, TokenKind::END
    };
    EXPECT_EQ(kinds_of(tokens), expected);
}

TEST(PythonTokenizerTest, BackslashContinuesLine)
{
    auto tokens = tokenize("x = 1 + \\\n    2\n");

    std::vector<TokenKind> expected = {
        TokenKind::NAME, TokenKind::OP, TokenKind::NUMBER, TokenKind::OP,
        TokenKind::NUMBER, TokenKind::NEWLINE, TokenKind::END
    };
    EXPECT_EQ(kinds_of(tokens), expected);
}

TEST(PythonTokenizerTest, CommentAndBlankLinesAreSkipped)
{
    auto tokens = tokenize("# heading\n\n   \nx  # trailing\n");

    std::vector<TokenKind> expected = {TokenKind::NAME, TokenKind::NEWLINE, TokenKind::END};
    EXPECT_EQ(kinds_of(tokens), expected);
    EXPECT_EQ(tokens[0].line, 4U);
}

TEST(PythonTokenizerTest, StringLiterals)
{
    auto tokens = tokenize("s = '''a\nb''' + rb'x' + f\"{y}\"\n");

    ASSERT_GE(tokens.size(), 6U);
    EXPECT_EQ(tokens[2], (Token{.kind = TokenKind::STRING, .text = "'''a\nb'''", .line = 1}));
    EXPECT_EQ(tokens[4].text, "rb'x'");
    EXPECT_EQ(tokens[6].text, "f\"{y}\"");
}

TEST(PythonTokenizerTest, NumbersWithExponentsAndRadix)
{
    auto tokens = tokenize("a = 1e-5 + 0x1F + 2.5j\n");

    EXPECT_EQ(tokens[2].text, "1e-5");
    EXPECT_EQ(tokens[4].text, "0x1F");
    EXPECT_EQ(tokens[6].text, "2.5j");
}

TEST(PythonTokenizerTest, OperatorsUseLongestMatch)
{
    auto tokens = tokenize("a **= b // c\n");

    EXPECT_EQ(tokens[1].text, "**=");
    EXPECT_EQ(tokens[3].text, "//");
}

TEST(PythonTokenizerTest, CarriageReturnLineEndings)
{
    auto tokens = tokenize("x = 1\r\ny = 2\r\n");

    ASSERT_EQ(tokens.size(), 9U);
    EXPECT_EQ(tokens[4].text, "y");
    EXPECT_EQ(tokens[4].line, 2U);
}

TEST(PythonTokenizerTest, LexicalErrorsThrow)
{
    EXPECT_THROW(tokenize("s = 'abc\n"), SyntaxCheckError);
    EXPECT_THROW(tokenize("s = '''abc\n"), SyntaxCheckError);
    EXPECT_THROW(tokenize("f(1, 2\n"), SyntaxCheckError);
    EXPECT_THROW(tokenize("f(1]\n"), SyntaxCheckError);
    EXPECT_THROW(tokenize("x = 1)\n"), SyntaxCheckError);
    EXPECT_THROW(tokenize("a $ b\n"), SyntaxCheckError);
    EXPECT_THROW(tokenize("if x:\n        a\n    b\n"), SyntaxCheckError);
}

TEST(PythonTokenizerTest, ErrorsCarryLineNumber)
{
    try {
        tokenize("x = 1\ny = 'open\n");
        FAIL() << "expected SyntaxCheckError";
    } catch (const SyntaxCheckError& e) {
        EXPECT_EQ(e.line(), 2U);
    }
}

TEST(PythonTokenizerTest, KeywordLookup)
{
    EXPECT_TRUE(is_python_keyword("lambda"));
    EXPECT_TRUE(is_python_keyword("None"));
    EXPECT_FALSE(is_python_keyword("print"));
    EXPECT_FALSE(is_python_keyword("match"));
}

} // namespace pyspot
