#include "pyspot/parsers/python_tokenizer.hpp"
#include "pyspot/core/text_utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace pyspot {

namespace {

constexpr size_t kTabSize = 8;

constexpr std::array<std::string_view, 35> kKeywords = {
    "False", "None",   "True",    "and",      "as",       "assert", "async",
    "await", "break",  "class",   "continue", "def",      "del",    "elif",
    "else",  "except", "finally", "for",      "from",     "global", "if",
    "import", "in",    "is",      "lambda",   "nonlocal", "not",    "or",
    "pass",  "raise",  "return",  "try",      "while",    "with",   "yield"};

constexpr std::array<std::string_view, 5> kThreeCharOperators = {"**=", "//=", ">>=", "<<=", "..."};

constexpr std::array<std::string_view, 19> kTwoCharOperators = {
    "**", "//", ">>", "<<", "<=", ">=", "==", "!=", "->", "+=",
    "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=", ":="};

constexpr std::string_view kSingleCharOperators = "+-*/%@&|^~<>()[]{},:.;=";

constexpr std::array<std::string_view, 8> kStringPrefixes = {"r", "u", "b", "f", "br", "rb", "fr", "rf"};

auto is_name_start(char ch) -> bool {
    auto byte = static_cast<unsigned char>(ch);
    return std::isalpha(byte) || ch == '_' || byte >= 0x80;
}

auto is_name_char(char ch) -> bool {
    return is_name_start(ch) || std::isdigit(static_cast<unsigned char>(ch));
}

auto is_digit(char ch) -> bool {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

auto matching_open(char close) -> char {
    switch (close) {
    case ')':
        return '(';
    case ']':
        return '[';
    default:
        return '{';
    }
}

} // namespace

auto is_python_keyword(std::string_view word) -> bool {
    return std::find(kKeywords.begin(), kKeywords.end(), word) != kKeywords.end();
}

PythonTokenizer::PythonTokenizer(std::string_view source) : source_(source) {}

auto PythonTokenizer::peek(size_t ahead) const -> char {
    return pos_ + ahead < source_.size() ? source_[pos_ + ahead] : '\0';
}

auto PythonTokenizer::at_line_break() const -> bool {
    return !at_end() && (peek() == '\n' || peek() == '\r');
}

auto PythonTokenizer::consume_line_break() -> void {
    if (peek() == '\r' && peek(1) == '\n') {
        pos_ += 2;
    } else {
        pos_ += 1;
    }
    ++line_;
}

auto PythonTokenizer::emit(TokenKind kind, std::string text) -> void {
    tokens_.push_back(Token{.kind = kind, .text = std::move(text), .line = line_});
}

auto PythonTokenizer::tokenize() -> std::vector<Token> {
    bool line_start = true;

    while (true) {
        if (line_start && brackets_.empty()) {
            if (!start_logical_line()) {
                break;
            }
            line_start = false;
        }
        if (at_end()) {
            break;
        }

        char ch = peek();
        if (ch == ' ' || ch == '\t' || ch == '\f') {
            ++pos_;
        } else if (ch == '#') {
            while (!at_end() && !at_line_break()) {
                ++pos_;
            }
        } else if (ch == '\\') {
            ++pos_;
            if (!at_line_break()) {
                throw SyntaxCheckError("unexpected character after line continuation character", line_);
            }
            consume_line_break();
            if (at_end()) {
                throw SyntaxCheckError("unexpected EOF while parsing", line_);
            }
        } else if (at_line_break()) {
            if (brackets_.empty()) {
                emit(TokenKind::NEWLINE, "");
                line_start = true;
            }
            consume_line_break();
        } else if (is_digit(ch) || (ch == '.' && is_digit(peek(1)))) {
            scan_number();
        } else if (is_name_start(ch)) {
            scan_name();
        } else if (ch == '\'' || ch == '"') {
            scan_string(pos_);
        } else {
            scan_operator();
        }
    }

    if (!brackets_.empty()) {
        throw SyntaxCheckError(std::string("'") + brackets_.back() + "' was never closed", line_);
    }

    if (!tokens_.empty() && tokens_.back().kind != TokenKind::NEWLINE) {
        emit(TokenKind::NEWLINE, "");
    }
    while (indents_.size() > 1) {
        indents_.pop_back();
        emit(TokenKind::DEDENT, "");
    }
    emit(TokenKind::END, "");

    return std::move(tokens_);
}

auto PythonTokenizer::start_logical_line() -> bool {
    while (true) {
        size_t column = 0;
        while (!at_end()) {
            char ch = peek();
            if (ch == ' ') {
                ++column;
            } else if (ch == '\t') {
                column = (column / kTabSize + 1) * kTabSize;
            } else if (ch == '\f') {
                column = 0;
            } else {
                break;
            }
            ++pos_;
        }

        if (at_end()) {
            return false;
        }

        // Blank and comment-only lines do not affect indentation
        if (peek() == '#') {
            while (!at_end() && !at_line_break()) {
                ++pos_;
            }
        }
        if (at_line_break()) {
            consume_line_break();
            continue;
        }
        if (at_end()) {
            return false;
        }

        if (column > indents_.back()) {
            indents_.push_back(column);
            emit(TokenKind::INDENT, "");
        } else {
            while (column < indents_.back()) {
                indents_.pop_back();
                emit(TokenKind::DEDENT, "");
            }
            if (column != indents_.back()) {
                throw SyntaxCheckError("unindent does not match any outer indentation level", line_);
            }
        }
        return true;
    }
}

auto PythonTokenizer::scan_name() -> void {
    size_t start = pos_;
    while (!at_end() && is_name_char(peek())) {
        ++pos_;
    }
    auto word = source_.substr(start, pos_ - start);

    if (peek() == '\'' || peek() == '"') {
        auto lowered = text::to_lowercase(word);
        if (std::find(kStringPrefixes.begin(), kStringPrefixes.end(), lowered) != kStringPrefixes.end()) {
            scan_string(start);
            return;
        }
    }

    emit(TokenKind::NAME, std::string(word));
}

auto PythonTokenizer::scan_number() -> void {
    size_t start = pos_;
    bool is_radix = peek() == '0' && (peek(1) == 'x' || peek(1) == 'X' || peek(1) == 'o'
                                      || peek(1) == 'O' || peek(1) == 'b' || peek(1) == 'B');

    while (!at_end()) {
        char ch = peek();
        if (is_name_char(ch) || ch == '.') {
            ++pos_;
            // Exponent sign: 1e-5, 2.5E+3
            if (!is_radix && (ch == 'e' || ch == 'E') && (peek() == '+' || peek() == '-')
                && is_digit(peek(1))) {
                ++pos_;
            }
        } else {
            break;
        }
    }

    emit(TokenKind::NUMBER, std::string(source_.substr(start, pos_ - start)));
}

auto PythonTokenizer::scan_string(size_t prefix_start) -> void {
    size_t start_line = line_;
    char quote = peek();
    bool triple = peek(1) == quote && peek(2) == quote;

    if (triple) {
        pos_ += 3;
        while (true) {
            if (at_end()) {
                throw SyntaxCheckError("unterminated triple-quoted string literal", start_line);
            }
            char ch = peek();
            if (ch == '\\') {
                ++pos_;
                if (at_line_break()) {
                    consume_line_break();
                } else if (!at_end()) {
                    ++pos_;
                }
            } else if (at_line_break()) {
                consume_line_break();
            } else if (ch == quote && peek(1) == quote && peek(2) == quote) {
                pos_ += 3;
                break;
            } else {
                ++pos_;
            }
        }
    } else {
        ++pos_;
        while (true) {
            if (at_end() || at_line_break()) {
                throw SyntaxCheckError("unterminated string literal", start_line);
            }
            char ch = peek();
            if (ch == '\\') {
                ++pos_;
                if (at_line_break()) {
                    consume_line_break();
                } else if (!at_end()) {
                    ++pos_;
                }
            } else if (ch == quote) {
                ++pos_;
                break;
            } else {
                ++pos_;
            }
        }
    }

    tokens_.push_back(Token{.kind = TokenKind::STRING,
                            .text = std::string(source_.substr(prefix_start, pos_ - prefix_start)),
                            .line = start_line});
}

auto PythonTokenizer::scan_operator() -> void {
    auto rest = source_.substr(pos_);

    for (auto op : kThreeCharOperators) {
        if (rest.starts_with(op)) {
            pos_ += op.size();
            emit(TokenKind::OP, std::string(op));
            return;
        }
    }
    for (auto op : kTwoCharOperators) {
        if (rest.starts_with(op)) {
            pos_ += op.size();
            emit(TokenKind::OP, std::string(op));
            return;
        }
    }

    char ch = peek();
    if (kSingleCharOperators.find(ch) == std::string_view::npos) {
        throw SyntaxCheckError(std::string("invalid character '") + ch + "'", line_);
    }

    if (ch == '(' || ch == '[' || ch == '{') {
        brackets_.push_back(ch);
    } else if (ch == ')' || ch == ']' || ch == '}') {
        if (brackets_.empty()) {
            throw SyntaxCheckError(std::string("unmatched '") + ch + "'", line_);
        }
        if (brackets_.back() != matching_open(ch)) {
            throw SyntaxCheckError(std::string("closing parenthesis '") + ch
                                       + "' does not match opening parenthesis '" + brackets_.back()
                                       + "'",
                                   line_);
        }
        brackets_.pop_back();
    }

    ++pos_;
    emit(TokenKind::OP, std::string(1, ch));
}

} // namespace pyspot
