#include "pyspot/parsers/python_syntax_checker.hpp"
#include <algorithm>
#include <array>
#include <utility>

namespace pyspot {

auto PythonSyntaxChecker::check(const std::string& source) const -> SyntaxCheckResult {
    try {
        PythonTokenizer tokenizer(source);
        detail::StatementParser parser(tokenizer.tokenize());
        parser.parse_file();
        return SyntaxCheckResult{.valid = true};
    } catch (const SyntaxCheckError& e) {
        return SyntaxCheckResult{.valid = false, .message = e.what(), .line = e.line()};
    }
}

namespace detail {

namespace {

constexpr std::array<std::string_view, 13> kAugmentedAssignments = {
    "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=", ">>=", "<<=", "**="};

constexpr std::array<std::string_view, 6> kComparisonOperators = {"==", "!=", "<", ">", "<=", ">="};

// Binary operator precedence, loosest first
const std::array<std::vector<std::string_view>, 6> kBinaryLevels = {{
    {"|"},
    {"^"},
    {"&"},
    {"<<", ">>"},
    {"+", "-"},
    {"*", "/", "//", "%", "@"},
}};

// Keywords that may begin an expression
constexpr std::array<std::string_view, 6> kExpressionKeywords = {"not", "lambda", "await", "True", "False", "None"};

template <size_t N>
auto contains(const std::array<std::string_view, N>& values, std::string_view value) -> bool {
    return std::find(values.begin(), values.end(), value) != values.end();
}

auto is_single_target(const ExprInfo& info) -> bool {
    return info.kind == ExprKind::NAME || info.kind == ExprKind::ATTRIBUTE || info.kind == ExprKind::SUBSCRIPT;
}

} // namespace

StatementParser::NestingGuard::NestingGuard(StatementParser& parser) : parser_(parser) {
    if (parser_.nesting_ >= PythonSyntaxChecker::kMaxNesting) {
        parser_.fail("too many nested parentheses");
    }
    ++parser_.nesting_;
}

StatementParser::NestingGuard::~NestingGuard() {
    --parser_.nesting_;
}

StatementParser::StatementParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().kind != TokenKind::END) {
        tokens_.push_back(Token{.kind = TokenKind::END});
    }
}

// ---------------------------------------------------------------------------
// Token cursor
// ---------------------------------------------------------------------------

auto StatementParser::current() const -> const Token& {
    return tokens_[std::min(index_, tokens_.size() - 1)];
}

auto StatementParser::peek_token(size_t ahead) const -> const Token& {
    return tokens_[std::min(index_ + ahead, tokens_.size() - 1)];
}

auto StatementParser::advance() -> const Token& {
    const auto& token = current();
    if (index_ < tokens_.size() - 1) {
        ++index_;
    }
    return token;
}

auto StatementParser::check_op(std::string_view op) const -> bool {
    return current().kind == TokenKind::OP && current().text == op;
}

auto StatementParser::check_keyword(std::string_view word) const -> bool {
    return current().kind == TokenKind::NAME && current().text == word;
}

auto StatementParser::accept_op(std::string_view op) -> bool {
    if (check_op(op)) {
        advance();
        return true;
    }
    return false;
}

auto StatementParser::accept_keyword(std::string_view word) -> bool {
    if (check_keyword(word)) {
        advance();
        return true;
    }
    return false;
}

auto StatementParser::expect_op(std::string_view op) -> void {
    if (!accept_op(op)) {
        fail("expected '" + std::string(op) + "'");
    }
}

auto StatementParser::expect_keyword(std::string_view word) -> void {
    if (!accept_keyword(word)) {
        fail("expected '" + std::string(word) + "'");
    }
}

auto StatementParser::expect_name() -> void {
    if (current().kind != TokenKind::NAME || is_python_keyword(current().text)) {
        fail("invalid syntax");
    }
    advance();
}

auto StatementParser::fail(const std::string& message) const -> void {
    throw SyntaxCheckError(message, current().line);
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

auto StatementParser::parse_file() -> void {
    while (current().kind != TokenKind::END) {
        if (current().kind == TokenKind::NEWLINE) {
            advance();
            continue;
        }
        parse_statement();
    }
}

auto StatementParser::parse_statement() -> void {
    const auto& token = current();

    if (token.kind == TokenKind::INDENT) {
        fail("unexpected indent");
    }
    if (token.kind == TokenKind::DEDENT) {
        fail("unexpected unindent");
    }
    if (check_op("@")) {
        parse_decorated();
        return;
    }
    if (token.kind != TokenKind::NAME) {
        parse_simple_statements();
        return;
    }

    if (token.text == "if") {
        parse_if();
    } else if (token.text == "while") {
        parse_while();
    } else if (token.text == "for") {
        parse_for();
    } else if (token.text == "try") {
        parse_try();
    } else if (token.text == "with") {
        parse_with();
    } else if (token.text == "def") {
        parse_function_def();
    } else if (token.text == "class") {
        parse_class_def();
    } else if (token.text == "match") {
        parse_match();
    } else if (token.text == "async") {
        advance();
        if (check_keyword("def")) {
            parse_function_def();
        } else if (check_keyword("for")) {
            parse_for();
        } else if (check_keyword("with")) {
            parse_with();
        } else {
            fail("invalid syntax");
        }
    } else {
        parse_simple_statements();
    }
}

auto StatementParser::parse_simple_statements() -> void {
    parse_simple_statement();
    while (accept_op(";")) {
        if (current().kind == TokenKind::NEWLINE) {
            break;
        }
        parse_simple_statement();
    }

    if (current().kind == TokenKind::NEWLINE) {
        advance();
    } else if (current().kind != TokenKind::END) {
        fail("invalid syntax");
    }
}

auto StatementParser::parse_simple_statement() -> void {
    const auto& token = current();
    if (token.kind != TokenKind::NAME || !is_python_keyword(token.text)) {
        parse_expression_statement();
        return;
    }

    const auto& word = token.text;
    if (word == "pass" || word == "break" || word == "continue") {
        advance();
    } else if (word == "return") {
        advance();
        if (starts_expression()) {
            parse_star_expressions();
        }
    } else if (word == "raise") {
        advance();
        if (starts_expression()) {
            parse_expression();
            if (accept_keyword("from")) {
                parse_expression();
            }
        }
    } else if (word == "global" || word == "nonlocal") {
        advance();
        expect_name();
        while (accept_op(",")) {
            expect_name();
        }
    } else if (word == "del") {
        advance();
        auto targets = parse_star_targets();
        require_target(targets, "delete");
    } else if (word == "assert") {
        advance();
        parse_expression();
        if (accept_op(",")) {
            parse_expression();
        }
    } else if (word == "import") {
        parse_import();
    } else if (word == "from") {
        parse_from_import();
    } else if (word == "yield" || contains(kExpressionKeywords, word)) {
        parse_expression_statement();
    } else {
        fail("invalid syntax");
    }
}

auto StatementParser::parse_expression_statement() -> void {
    auto value_or_yield = [this] {
        return check_keyword("yield") ? parse_yield_expression() : parse_star_expressions();
    };

    auto first = value_or_yield();

    if (check_op("=")) {
        auto target = first;
        while (accept_op("=")) {
            require_target(target, "assign to");
            target = value_or_yield();
        }
        return;
    }

    if (current().kind == TokenKind::OP && contains(kAugmentedAssignments, current().text)) {
        if (!is_single_target(first)) {
            fail("illegal expression for augmented assignment");
        }
        advance();
        value_or_yield();
        return;
    }

    if (check_op(":")) {
        if (!is_single_target(first)) {
            fail("illegal target for annotation");
        }
        advance();
        parse_expression();
        if (accept_op("=")) {
            value_or_yield();
        }
        return;
    }

    if (first.kind == ExprKind::STARRED) {
        fail("can't use starred expression here");
    }
}

auto StatementParser::parse_import() -> void {
    expect_keyword("import");
    do {
        parse_dotted_name();
        if (accept_keyword("as")) {
            expect_name();
        }
    } while (accept_op(","));
}

auto StatementParser::parse_from_import() -> void {
    expect_keyword("from");

    size_t dots = 0;
    while (check_op(".") || check_op("...")) {
        dots += current().text.size();
        advance();
    }
    if (!check_keyword("import")) {
        parse_dotted_name();
    } else if (dots == 0) {
        fail("invalid syntax");
    }

    expect_keyword("import");
    if (accept_op("*")) {
        return;
    }

    bool parenthesized = accept_op("(");
    expect_name();
    if (accept_keyword("as")) {
        expect_name();
    }
    while (accept_op(",")) {
        if (parenthesized && check_op(")")) {
            break;
        }
        expect_name();
        if (accept_keyword("as")) {
            expect_name();
        }
    }
    if (parenthesized) {
        expect_op(")");
    }
}

auto StatementParser::parse_dotted_name() -> void {
    expect_name();
    while (accept_op(".")) {
        expect_name();
    }
}

auto StatementParser::parse_block() -> void {
    NestingGuard guard(*this);

    if (current().kind != TokenKind::NEWLINE) {
        parse_simple_statements();
        return;
    }

    advance();
    if (current().kind != TokenKind::INDENT) {
        fail("expected an indented block");
    }
    advance();

    while (current().kind != TokenKind::DEDENT && current().kind != TokenKind::END) {
        if (current().kind == TokenKind::NEWLINE) {
            advance();
            continue;
        }
        parse_statement();
    }
    if (current().kind == TokenKind::DEDENT) {
        advance();
    }
}

auto StatementParser::parse_if() -> void {
    expect_keyword("if");
    parse_named_expression();
    expect_op(":");
    parse_block();

    while (accept_keyword("elif")) {
        parse_named_expression();
        expect_op(":");
        parse_block();
    }
    if (accept_keyword("else")) {
        expect_op(":");
        parse_block();
    }
}

auto StatementParser::parse_while() -> void {
    expect_keyword("while");
    parse_named_expression();
    expect_op(":");
    parse_block();

    if (accept_keyword("else")) {
        expect_op(":");
        parse_block();
    }
}

auto StatementParser::parse_for() -> void {
    expect_keyword("for");
    auto targets = parse_star_targets();
    require_target(targets, "assign to");
    expect_keyword("in");
    parse_star_expressions();
    expect_op(":");
    parse_block();

    if (accept_keyword("else")) {
        expect_op(":");
        parse_block();
    }
}

auto StatementParser::parse_try() -> void {
    expect_keyword("try");
    expect_op(":");
    parse_block();

    bool has_handlers = false;
    while (accept_keyword("except")) {
        accept_op("*");
        if (!check_op(":")) {
            parse_expression();
            if (accept_keyword("as")) {
                expect_name();
            }
        }
        expect_op(":");
        parse_block();
        has_handlers = true;
    }

    if (has_handlers && accept_keyword("else")) {
        expect_op(":");
        parse_block();
    }

    bool has_finally = false;
    if (accept_keyword("finally")) {
        expect_op(":");
        parse_block();
        has_finally = true;
    }

    if (!has_handlers && !has_finally) {
        fail("expected 'except' or 'finally' block");
    }
}

auto StatementParser::parse_with() -> void {
    expect_keyword("with");

    // with (a as b, c as d): is tried first, falling back to a parenthesized expression
    size_t saved_header = index_;
    if (check_op("(")) {
        try {
            advance();
            parse_with_item();
            while (accept_op(",")) {
                if (check_op(")")) {
                    break;
                }
                parse_with_item();
            }
            expect_op(")");
            expect_op(":");
        } catch (const SyntaxCheckError&) {
            index_ = saved_header;
        }
    }

    if (index_ == saved_header) {
        parse_with_item();
        while (accept_op(",")) {
            parse_with_item();
        }
        expect_op(":");
    }
    parse_block();
}

auto StatementParser::parse_with_item() -> void {
    parse_expression();
    if (accept_keyword("as")) {
        auto target = parse_binary(0);
        require_target(target, "assign to");
    }
}

auto StatementParser::parse_function_def() -> void {
    expect_keyword("def");
    expect_name();
    expect_op("(");
    parse_parameters(true, ")");
    expect_op(")");
    if (accept_op("->")) {
        parse_expression();
    }
    expect_op(":");
    parse_block();
}

auto StatementParser::parse_class_def() -> void {
    expect_keyword("class");
    expect_name();
    if (accept_op("(")) {
        if (!check_op(")")) {
            parse_arguments();
        }
        expect_op(")");
    }
    expect_op(":");
    parse_block();
}

auto StatementParser::parse_decorated() -> void {
    while (accept_op("@")) {
        parse_named_expression();
        if (current().kind != TokenKind::NEWLINE) {
            fail("invalid syntax");
        }
        advance();
    }

    if (check_keyword("def")) {
        parse_function_def();
    } else if (check_keyword("class")) {
        parse_class_def();
    } else if (check_keyword("async") && peek_token().kind == TokenKind::NAME && peek_token().text == "def") {
        advance();
        parse_function_def();
    } else {
        fail("expected function or class after decorator");
    }
}

auto StatementParser::parse_parameters(bool allow_annotations, std::string_view closing) -> void {
    auto annotation = [&] {
        if (allow_annotations && accept_op(":")) {
            accept_op("*");
            parse_expression();
        }
    };

    if (check_op(closing)) {
        return;
    }

    bool seen_default = false;
    bool keyword_only = false;
    bool seen_var_keyword = false;

    while (true) {
        if (seen_var_keyword) {
            fail("arguments cannot follow var-keyword argument");
        }

        if (accept_op("/")) {
            if (keyword_only) {
                fail("/ must be ahead of *");
            }
        } else if (accept_op("**")) {
            expect_name();
            annotation();
            seen_var_keyword = true;
        } else if (accept_op("*")) {
            if (keyword_only) {
                fail("* argument may appear only once");
            }
            keyword_only = true;
            if (current().kind == TokenKind::NAME) {
                expect_name();
                annotation();
            }
        } else {
            expect_name();
            annotation();
            if (accept_op("=")) {
                parse_expression();
                seen_default = true;
            } else if (seen_default && !keyword_only) {
                fail("parameter without a default follows parameter with a default");
            }
        }

        if (!accept_op(",") || check_op(closing)) {
            break;
        }
    }
}

// ---------------------------------------------------------------------------
// Match statement (soft keywords match and case)
// ---------------------------------------------------------------------------

auto StatementParser::parse_match() -> void {
    // "match" is an ordinary name unless a full "match subject:" header follows
    size_t saved = index_;
    try {
        advance();
        if (!starts_expression()) {
            fail("invalid syntax");
        }
        parse_star_named_expression();
        while (accept_op(",")) {
            if (check_op(":")) {
                break;
            }
            parse_star_named_expression();
        }
        expect_op(":");
        if (current().kind != TokenKind::NEWLINE) {
            fail("invalid syntax");
        }
    } catch (const SyntaxCheckError&) {
        index_ = saved;
        parse_simple_statements();
        return;
    }

    NestingGuard guard(*this);
    advance();
    if (current().kind != TokenKind::INDENT) {
        fail("expected an indented block");
    }
    advance();

    while (current().kind != TokenKind::DEDENT && current().kind != TokenKind::END) {
        if (current().kind == TokenKind::NEWLINE) {
            advance();
            continue;
        }
        if (!check_keyword("case")) {
            fail("expected 'case' block");
        }
        parse_case_clause();
    }
    if (current().kind == TokenKind::DEDENT) {
        advance();
    }
}

auto StatementParser::parse_case_clause() -> void {
    expect_keyword("case");
    parse_open_sequence_pattern();
    if (accept_keyword("if")) {
        parse_named_expression();
    }
    expect_op(":");
    parse_block();
}

auto StatementParser::parse_open_sequence_pattern() -> void {
    parse_maybe_star_pattern();
    while (accept_op(",")) {
        if (check_op(":") || check_keyword("if")) {
            break;
        }
        parse_maybe_star_pattern();
    }
}

auto StatementParser::parse_maybe_star_pattern() -> void {
    if (accept_op("*")) {
        expect_name();
        return;
    }
    parse_as_pattern();
}

auto StatementParser::parse_as_pattern() -> void {
    parse_or_pattern();
    if (accept_keyword("as")) {
        expect_name();
    }
}

auto StatementParser::parse_or_pattern() -> void {
    NestingGuard guard(*this);
    parse_closed_pattern();
    while (accept_op("|")) {
        parse_closed_pattern();
    }
}

auto StatementParser::parse_closed_pattern() -> void {
    if (parse_literal_pattern()) {
        return;
    }

    if (current().kind == TokenKind::NAME) {
        // Capture, wildcard, dotted value or class pattern
        expect_name();
        while (accept_op(".")) {
            expect_name();
        }
        if (accept_op("(")) {
            parse_class_pattern_arguments();
            expect_op(")");
        }
        return;
    }

    if (accept_op("(")) {
        parse_pattern_sequence(")");
        expect_op(")");
    } else if (accept_op("[")) {
        parse_pattern_sequence("]");
        expect_op("]");
    } else if (accept_op("{")) {
        parse_mapping_pattern();
        expect_op("}");
    } else {
        fail("invalid syntax");
    }
}

auto StatementParser::parse_literal_pattern() -> bool {
    const auto& token = current();

    if (token.kind == TokenKind::STRING) {
        while (current().kind == TokenKind::STRING) {
            advance();
        }
        return true;
    }
    if (token.kind == TokenKind::NAME && (token.text == "None" || token.text == "True" || token.text == "False")) {
        advance();
        return true;
    }

    bool negative = check_op("-");
    if (!negative && token.kind != TokenKind::NUMBER) {
        return false;
    }
    if (negative) {
        advance();
        if (current().kind != TokenKind::NUMBER) {
            fail("invalid syntax");
        }
    }
    advance();

    // Complex literal such as 1 + 2j
    if ((check_op("+") || check_op("-")) && peek_token().kind == TokenKind::NUMBER) {
        advance();
        advance();
    }
    return true;
}

auto StatementParser::parse_pattern_sequence(std::string_view closing) -> void {
    if (check_op(closing)) {
        return;
    }
    parse_maybe_star_pattern();
    while (accept_op(",")) {
        if (check_op(closing)) {
            break;
        }
        parse_maybe_star_pattern();
    }
}

auto StatementParser::parse_class_pattern_arguments() -> void {
    if (check_op(")")) {
        return;
    }

    bool seen_keyword = false;
    while (true) {
        if (current().kind == TokenKind::NAME && !is_python_keyword(current().text)
            && peek_token().kind == TokenKind::OP && peek_token().text == "=") {
            advance();
            advance();
            parse_as_pattern();
            seen_keyword = true;
        } else {
            if (seen_keyword) {
                fail("positional patterns follow keyword patterns");
            }
            parse_as_pattern();
        }

        if (!accept_op(",") || check_op(")")) {
            break;
        }
    }
}

auto StatementParser::parse_mapping_pattern() -> void {
    if (check_op("}")) {
        return;
    }

    while (true) {
        if (accept_op("**")) {
            expect_name();
        } else {
            if (!parse_literal_pattern()) {
                // Keys are literals or dotted value lookups, never bare captures
                expect_name();
                if (!check_op(".")) {
                    fail("mapping pattern keys may only match literals and attribute lookups");
                }
                while (accept_op(".")) {
                    expect_name();
                }
            }
            expect_op(":");
            parse_as_pattern();
        }

        if (!accept_op(",") || check_op("}")) {
            break;
        }
    }
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

auto StatementParser::parse_star_expressions() -> ExprInfo {
    auto first = parse_star_expression();
    if (!check_op(",")) {
        return first;
    }

    bool assignable = first.assignable;
    while (accept_op(",")) {
        if (!starts_expression()) {
            break;
        }
        auto next = parse_star_expression();
        assignable = assignable && next.assignable;
    }
    return ExprInfo{.kind = ExprKind::TUPLE, .assignable = assignable};
}

auto StatementParser::parse_star_expression() -> ExprInfo {
    if (accept_op("*")) {
        auto inner = parse_binary(0);
        return ExprInfo{.kind = ExprKind::STARRED, .assignable = inner.assignable};
    }
    return parse_expression();
}

auto StatementParser::parse_star_targets() -> ExprInfo {
    auto target = [this] {
        if (accept_op("*")) {
            auto inner = parse_binary(0);
            return ExprInfo{.kind = ExprKind::STARRED, .assignable = inner.assignable};
        }
        return parse_binary(0);
    };

    auto first = target();
    if (!check_op(",")) {
        return first;
    }

    bool assignable = first.assignable;
    while (accept_op(",")) {
        if (!starts_expression()) {
            break;
        }
        auto next = target();
        assignable = assignable && next.assignable;
    }
    return ExprInfo{.kind = ExprKind::TUPLE, .assignable = assignable};
}

auto StatementParser::parse_named_expression() -> ExprInfo {
    if (current().kind == TokenKind::NAME && !is_python_keyword(current().text)
        && peek_token().kind == TokenKind::OP && peek_token().text == ":=") {
        advance();
        advance();
        parse_expression();
        return ExprInfo{};
    }
    return parse_expression();
}

auto StatementParser::parse_expression() -> ExprInfo {
    NestingGuard guard(*this);
    if (check_keyword("lambda")) {
        return parse_lambda();
    }

    auto value = parse_disjunction();
    if (accept_keyword("if")) {
        parse_disjunction();
        expect_keyword("else");
        parse_expression();
        return ExprInfo{};
    }
    return value;
}

auto StatementParser::parse_yield_expression() -> ExprInfo {
    expect_keyword("yield");
    if (accept_keyword("from")) {
        parse_expression();
    } else if (starts_expression()) {
        parse_star_expressions();
    }
    return ExprInfo{};
}

auto StatementParser::parse_lambda() -> ExprInfo {
    expect_keyword("lambda");
    parse_parameters(false, ":");
    expect_op(":");
    parse_expression();
    return ExprInfo{};
}

auto StatementParser::parse_disjunction() -> ExprInfo {
    auto value = parse_conjunction();
    if (!check_keyword("or")) {
        return value;
    }
    while (accept_keyword("or")) {
        parse_conjunction();
    }
    return ExprInfo{};
}

auto StatementParser::parse_conjunction() -> ExprInfo {
    auto value = parse_inversion();
    if (!check_keyword("and")) {
        return value;
    }
    while (accept_keyword("and")) {
        parse_inversion();
    }
    return ExprInfo{};
}

auto StatementParser::parse_inversion() -> ExprInfo {
    if (check_keyword("not")) {
        NestingGuard guard(*this);
        advance();
        parse_inversion();
        return ExprInfo{};
    }
    return parse_comparison();
}

auto StatementParser::parse_comparison() -> ExprInfo {
    auto value = parse_binary(0);
    bool compared = false;

    while (true) {
        if (current().kind == TokenKind::OP && contains(kComparisonOperators, current().text)) {
            advance();
        } else if (check_keyword("in")) {
            advance();
        } else if (check_keyword("not") && peek_token().kind == TokenKind::NAME && peek_token().text == "in") {
            advance();
            advance();
        } else if (check_keyword("is")) {
            advance();
            accept_keyword("not");
        } else {
            break;
        }
        parse_binary(0);
        compared = true;
    }

    return compared ? ExprInfo{} : value;
}

auto StatementParser::parse_binary(size_t level) -> ExprInfo {
    auto operand = [&] { return level + 1 < kBinaryLevels.size() ? parse_binary(level + 1) : parse_factor(); };
    const auto& operators = kBinaryLevels[level];
    auto is_level_operator = [&] {
        return current().kind == TokenKind::OP
               && std::find(operators.begin(), operators.end(), current().text) != operators.end();
    };

    auto value = operand();
    if (!is_level_operator()) {
        return value;
    }
    while (is_level_operator()) {
        advance();
        operand();
    }
    return ExprInfo{};
}

auto StatementParser::parse_factor() -> ExprInfo {
    if (check_op("-") || check_op("+") || check_op("~")) {
        NestingGuard guard(*this);
        advance();
        parse_factor();
        return ExprInfo{};
    }
    return parse_power();
}

auto StatementParser::parse_power() -> ExprInfo {
    ExprInfo value;
    if (accept_keyword("await")) {
        parse_primary();
    } else {
        value = parse_primary();
    }

    if (accept_op("**")) {
        parse_factor();
        return ExprInfo{};
    }
    return value;
}

auto StatementParser::parse_primary() -> ExprInfo {
    NestingGuard guard(*this);
    auto value = parse_atom();

    while (true) {
        if (accept_op(".")) {
            expect_name();
            value = ExprInfo{.kind = ExprKind::ATTRIBUTE, .assignable = true};
        } else if (accept_op("(")) {
            if (!check_op(")")) {
                parse_arguments();
            }
            expect_op(")");
            value = ExprInfo{};
        } else if (accept_op("[")) {
            parse_subscript();
            expect_op("]");
            value = ExprInfo{.kind = ExprKind::SUBSCRIPT, .assignable = true};
        } else {
            break;
        }
    }
    return value;
}

auto StatementParser::parse_atom() -> ExprInfo {
    const auto& token = current();

    switch (token.kind) {
    case TokenKind::NAME:
        if (token.text == "True" || token.text == "False" || token.text == "None") {
            advance();
            return ExprInfo{};
        }
        if (is_python_keyword(token.text)) {
            fail("invalid syntax");
        }
        advance();
        return ExprInfo{.kind = ExprKind::NAME, .assignable = true};
    case TokenKind::NUMBER:
        advance();
        return ExprInfo{};
    case TokenKind::STRING:
        // Adjacent literals concatenate
        while (current().kind == TokenKind::STRING) {
            advance();
        }
        return ExprInfo{};
    default:
        break;
    }

    if (accept_op("...")) {
        return ExprInfo{};
    }
    if (check_op("(")) {
        return parse_parenthesized();
    }
    if (check_op("[")) {
        return parse_list_display();
    }
    if (check_op("{")) {
        return parse_brace_display();
    }
    fail("invalid syntax");
}

auto StatementParser::parse_parenthesized() -> ExprInfo {
    expect_op("(");
    if (accept_op(")")) {
        return ExprInfo{.kind = ExprKind::TUPLE, .assignable = true};
    }
    if (check_keyword("yield")) {
        parse_yield_expression();
        expect_op(")");
        return ExprInfo{};
    }

    auto first = parse_star_named_expression();
    if (at_comprehension()) {
        parse_comprehension_clauses();
        expect_op(")");
        return ExprInfo{};
    }
    if (accept_op(")")) {
        if (first.kind == ExprKind::STARRED) {
            fail("cannot use starred expression here");
        }
        return first;
    }

    bool assignable = first.assignable;
    while (accept_op(",")) {
        if (check_op(")")) {
            break;
        }
        auto next = parse_star_named_expression();
        assignable = assignable && next.assignable;
    }
    expect_op(")");
    return ExprInfo{.kind = ExprKind::TUPLE, .assignable = assignable};
}

auto StatementParser::parse_star_named_expression() -> ExprInfo {
    if (accept_op("*")) {
        auto inner = parse_binary(0);
        return ExprInfo{.kind = ExprKind::STARRED, .assignable = inner.assignable};
    }
    return parse_named_expression();
}

auto StatementParser::parse_list_display() -> ExprInfo {
    expect_op("[");
    if (accept_op("]")) {
        return ExprInfo{.kind = ExprKind::LIST, .assignable = true};
    }

    auto first = parse_star_named_expression();
    if (at_comprehension()) {
        parse_comprehension_clauses();
        expect_op("]");
        return ExprInfo{};
    }

    bool assignable = first.assignable;
    while (accept_op(",")) {
        if (check_op("]")) {
            break;
        }
        auto next = parse_star_named_expression();
        assignable = assignable && next.assignable;
    }
    expect_op("]");
    return ExprInfo{.kind = ExprKind::LIST, .assignable = assignable};
}

auto StatementParser::parse_brace_display() -> ExprInfo {
    expect_op("{");
    if (accept_op("}")) {
        return ExprInfo{};
    }

    auto dict_entries = [this] {
        while (accept_op(",")) {
            if (check_op("}")) {
                break;
            }
            if (accept_op("**")) {
                parse_binary(0);
            } else {
                parse_expression();
                expect_op(":");
                parse_expression();
            }
        }
        expect_op("}");
    };

    if (accept_op("**")) {
        parse_binary(0);
        dict_entries();
        return ExprInfo{};
    }

    auto first = parse_star_named_expression();
    if (accept_op(":")) {
        if (first.kind == ExprKind::STARRED) {
            fail("cannot use a starred expression in a dictionary value");
        }
        parse_expression();
        if (at_comprehension()) {
            parse_comprehension_clauses();
            expect_op("}");
        } else {
            dict_entries();
        }
        return ExprInfo{};
    }

    // Set display
    if (at_comprehension()) {
        parse_comprehension_clauses();
        expect_op("}");
        return ExprInfo{};
    }
    while (accept_op(",")) {
        if (check_op("}")) {
            break;
        }
        parse_star_named_expression();
    }
    expect_op("}");
    return ExprInfo{};
}

auto StatementParser::parse_arguments() -> void {
    bool seen_keyword = false;
    bool seen_double_star = false;
    bool seen_generator = false;
    size_t count = 0;

    while (true) {
        if (seen_generator) {
            fail("Generator expression must be parenthesized");
        }
        ++count;

        if (accept_op("**")) {
            parse_expression();
            seen_double_star = true;
        } else if (accept_op("*")) {
            if (seen_double_star) {
                fail("iterable argument unpacking follows keyword argument unpacking");
            }
            parse_expression();
        } else if (current().kind == TokenKind::NAME && !is_python_keyword(current().text)
                   && peek_token().kind == TokenKind::OP && peek_token().text == "=") {
            advance();
            advance();
            parse_expression();
            seen_keyword = true;
        } else {
            if (seen_double_star) {
                fail("positional argument follows keyword argument unpacking");
            }
            if (seen_keyword) {
                fail("positional argument follows keyword argument");
            }
            parse_named_expression();
            if (at_comprehension()) {
                if (count > 1) {
                    fail("Generator expression must be parenthesized");
                }
                parse_comprehension_clauses();
                seen_generator = true;
            }
        }

        if (!accept_op(",")) {
            break;
        }
        if (check_op(")")) {
            if (seen_generator) {
                fail("Generator expression must be parenthesized");
            }
            break;
        }
    }
}

auto StatementParser::parse_subscript() -> void {
    parse_slice();
    while (accept_op(",")) {
        if (check_op("]")) {
            break;
        }
        parse_slice();
    }
}

auto StatementParser::parse_slice() -> void {
    if (accept_op("*")) {
        parse_binary(0);
        return;
    }
    if (!check_op(":")) {
        parse_named_expression();
        if (!check_op(":")) {
            return;
        }
    }

    expect_op(":");
    if (!check_op(":") && !check_op("]") && !check_op(",")) {
        parse_expression();
    }
    if (accept_op(":")) {
        if (!check_op("]") && !check_op(",")) {
            parse_expression();
        }
    }
}

auto StatementParser::parse_comprehension_clauses() -> void {
    while (at_comprehension()) {
        accept_keyword("async");
        expect_keyword("for");
        auto targets = parse_star_targets();
        require_target(targets, "assign to");
        expect_keyword("in");
        parse_disjunction();
        while (accept_keyword("if")) {
            parse_disjunction();
        }
    }
}

auto StatementParser::at_comprehension() const -> bool {
    return check_keyword("for")
           || (check_keyword("async") && peek_token().kind == TokenKind::NAME && peek_token().text == "for");
}

auto StatementParser::starts_expression() const -> bool {
    const auto& token = current();
    switch (token.kind) {
    case TokenKind::NAME:
        return !is_python_keyword(token.text) || contains(kExpressionKeywords, token.text);
    case TokenKind::NUMBER:
    case TokenKind::STRING:
        return true;
    case TokenKind::OP:
        return token.text == "(" || token.text == "[" || token.text == "{" || token.text == "-"
               || token.text == "+" || token.text == "~" || token.text == "*" || token.text == "...";
    default:
        return false;
    }
}

auto StatementParser::require_target(const ExprInfo& info, std::string_view context) const -> void {
    if (info.kind == ExprKind::STARRED) {
        fail("starred assignment target must be in a list or tuple");
    }
    if (!info.assignable) {
        fail("cannot " + std::string(context) + " expression");
    }
}

} // namespace detail

} // namespace pyspot
