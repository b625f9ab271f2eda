#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pyspot {

enum class TokenKind {
    NAME,
    NUMBER,
    STRING,
    OP,
    NEWLINE,
    INDENT,
    DEDENT,
    END
};

struct Token {
    TokenKind kind{};
    std::string text;
    size_t line{};

    auto operator==(const Token& other) const -> bool = default;
};

class SyntaxCheckError : public std::runtime_error {
public:
    SyntaxCheckError(const std::string& message, size_t line)
        : std::runtime_error(message), line_(line) {}

    auto line() const -> size_t { return line_; }

private:
    size_t line_;
};

// Python-flavoured lexer producing INDENT/DEDENT/NEWLINE like the tokenize module.
// Throws SyntaxCheckError on lexical errors.
class PythonTokenizer {
public:
    explicit PythonTokenizer(std::string_view source);

    auto tokenize() -> std::vector<Token>;

private:
    auto at_end() const -> bool { return pos_ >= source_.size(); }
    auto peek(size_t ahead = 0) const -> char;
    auto at_line_break() const -> bool;
    auto consume_line_break() -> void;

    auto start_logical_line() -> bool;
    auto scan_name() -> void;
    auto scan_number() -> void;
    auto scan_string(size_t prefix_start) -> void;
    auto scan_operator() -> void;
    auto emit(TokenKind kind, std::string text) -> void;

    std::string_view source_;
    size_t pos_ = 0;
    size_t line_ = 1;
    std::vector<size_t> indents_{0};
    std::vector<char> brackets_;
    std::vector<Token> tokens_;
};

auto is_python_keyword(std::string_view word) -> bool;

} // namespace pyspot
