#pragma once

#include "pyspot/interfaces.hpp"
#include "pyspot/parsers/python_tokenizer.hpp"
#include <string>
#include <vector>

namespace pyspot {

struct SyntaxCheckResult {
    bool valid = false;
    std::string message;
    size_t line{};
};

// Structural stand-in for Python's own parser: accepts what ast.parse would
// accept for the statement and expression forms commonly pasted as snippets
class PythonSyntaxChecker : public ISyntaxChecker {
public:
    static constexpr size_t kMaxNesting = 100;

    auto check(const std::string& source) const -> SyntaxCheckResult override;
};

namespace detail {

// What kind of expression was parsed, for assignment target validation
enum class ExprKind {
    NAME,
    ATTRIBUTE,
    SUBSCRIPT,
    STARRED,
    TUPLE,
    LIST,
    OTHER
};

struct ExprInfo {
    ExprKind kind = ExprKind::OTHER;
    bool assignable = false;
};

class StatementParser {
public:
    explicit StatementParser(std::vector<Token> tokens);

    // Throws SyntaxCheckError on the first violation
    auto parse_file() -> void;

private:
    // Token cursor
    auto current() const -> const Token&;
    auto peek_token(size_t ahead = 1) const -> const Token&;
    auto advance() -> const Token&;
    auto check_op(std::string_view op) const -> bool;
    auto check_keyword(std::string_view word) const -> bool;
    auto accept_op(std::string_view op) -> bool;
    auto accept_keyword(std::string_view word) -> bool;
    auto expect_op(std::string_view op) -> void;
    auto expect_keyword(std::string_view word) -> void;
    auto expect_name() -> void;
    [[noreturn]] auto fail(const std::string& message) const -> void;

    // Statements
    auto parse_statement() -> void;
    auto parse_simple_statements() -> void;
    auto parse_simple_statement() -> void;
    auto parse_expression_statement() -> void;
    auto parse_import() -> void;
    auto parse_from_import() -> void;
    auto parse_dotted_name() -> void;
    auto parse_block() -> void;
    auto parse_if() -> void;
    auto parse_while() -> void;
    auto parse_for() -> void;
    auto parse_try() -> void;
    auto parse_with() -> void;
    auto parse_with_item() -> void;
    auto parse_function_def() -> void;
    auto parse_class_def() -> void;
    auto parse_decorated() -> void;
    auto parse_parameters(bool allow_annotations, std::string_view closing) -> void;
    auto parse_match() -> void;
    auto parse_case_clause() -> void;

    // Match patterns
    auto parse_open_sequence_pattern() -> void;
    auto parse_maybe_star_pattern() -> void;
    auto parse_as_pattern() -> void;
    auto parse_or_pattern() -> void;
    auto parse_closed_pattern() -> void;
    auto parse_literal_pattern() -> bool;
    auto parse_pattern_sequence(std::string_view closing) -> void;
    auto parse_class_pattern_arguments() -> void;
    auto parse_mapping_pattern() -> void;

    // Expressions
    auto parse_star_expressions() -> ExprInfo;
    auto parse_star_expression() -> ExprInfo;
    auto parse_star_targets() -> ExprInfo;
    auto parse_star_named_expression() -> ExprInfo;
    auto parse_named_expression() -> ExprInfo;
    auto parse_expression() -> ExprInfo;
    auto parse_yield_expression() -> ExprInfo;
    auto parse_lambda() -> ExprInfo;
    auto parse_disjunction() -> ExprInfo;
    auto parse_conjunction() -> ExprInfo;
    auto parse_inversion() -> ExprInfo;
    auto parse_comparison() -> ExprInfo;
    auto parse_binary(size_t level) -> ExprInfo;
    auto parse_factor() -> ExprInfo;
    auto parse_power() -> ExprInfo;
    auto parse_primary() -> ExprInfo;
    auto parse_atom() -> ExprInfo;
    auto parse_parenthesized() -> ExprInfo;
    auto parse_list_display() -> ExprInfo;
    auto parse_brace_display() -> ExprInfo;
    auto parse_arguments() -> void;
    auto parse_subscript() -> void;
    auto parse_slice() -> void;
    auto parse_comprehension_clauses() -> void;
    auto at_comprehension() const -> bool;
    auto starts_expression() const -> bool;
    auto require_target(const ExprInfo& info, std::string_view context) const -> void;

    struct NestingGuard {
        explicit NestingGuard(StatementParser& parser);
        ~NestingGuard();
        NestingGuard(const NestingGuard&) = delete;
        auto operator=(const NestingGuard&) -> NestingGuard& = delete;
        StatementParser& parser_;
    };

    std::vector<Token> tokens_;
    size_t index_ = 0;
    size_t nesting_ = 0;
};

} // namespace detail

} // namespace pyspot
