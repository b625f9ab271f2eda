#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pyspot::text {

// Split on \n, \r\n and \r, keeping the terminators (Python's splitlines(keepends=True))
auto split_lines_keep_ends(std::string_view text) -> std::vector<std::string>;

// Same split with the terminators dropped
auto split_lines(std::string_view text) -> std::vector<std::string>;

auto join(const std::vector<std::string>& parts, std::string_view separator) -> std::string;

auto trim(std::string_view text) -> std::string;
auto to_lowercase(std::string_view text) -> std::string;
auto is_blank(std::string_view text) -> bool;
auto extract_indentation(std::string_view line) -> std::string;

// Maximal runs of ASCII letters and underscore
auto word_tokens(std::string_view text) -> std::vector<std::string>;

// Truncate every line at the first comment marker, rejoin with '\n'
auto strip_comments(std::string_view block, char comment_marker = '#') -> std::string;

// Remove the whitespace prefix shared by every non-blank line (textwrap.dedent)
auto dedent(std::string_view block) -> std::string;

// Literal "\n" / "\r" sequences <-> real line breaks
auto interpret_escaped_newlines(std::string_view text) -> std::string;
auto reescape_newlines(std::string_view text) -> std::string;

auto count_occurrences(std::string_view haystack, std::string_view needle) -> size_t;

} // namespace pyspot::text
