#include "pyspot/core/text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <optional>

namespace pyspot::text {

auto split_lines_keep_ends(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    size_t line_start = 0;
    size_t i = 0;

    while (i < text.size()) {
        char ch = text[i];
        if (ch == '\n' || ch == '\r') {
            size_t terminator = (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ? 2 : 1;
            i += terminator;
            lines.emplace_back(text.substr(line_start, i - line_start));
            line_start = i;
        } else {
            ++i;
        }
    }

    if (line_start < text.size()) {
        lines.emplace_back(text.substr(line_start));
    }

    return lines;
}

auto split_lines(std::string_view text) -> std::vector<std::string> {
    auto lines = split_lines_keep_ends(text);
    for (auto& line : lines) {
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
    }
    return lines;
}

auto join(const std::vector<std::string>& parts, std::string_view separator) -> std::string {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

auto trim(std::string_view text) -> std::string {
    auto start = text.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n\f\v");
    return std::string(text.substr(start, end - start + 1));
}

auto to_lowercase(std::string_view text) -> std::string {
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return result;
}

auto is_blank(std::string_view text) -> bool {
    return text.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos;
}

auto extract_indentation(std::string_view line) -> std::string {
    size_t first_non_space = line.find_first_not_of(" \t");
    if (first_non_space == std::string_view::npos) {
        return "";
    }
    return std::string(line.substr(0, first_non_space));
}

auto word_tokens(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    auto is_word_char = [](char ch) {
        return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
    };

    size_t i = 0;
    while (i < text.size()) {
        if (!is_word_char(text[i])) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < text.size() && is_word_char(text[i])) {
            ++i;
        }
        tokens.emplace_back(text.substr(start, i - start));
    }

    return tokens;
}

auto strip_comments(std::string_view block, char comment_marker) -> std::string {
    auto lines = split_lines(block);
    for (auto& line : lines) {
        auto marker = line.find(comment_marker);
        if (marker != std::string::npos) {
            line.erase(marker);
        }
    }
    return join(lines, "\n");
}

auto dedent(std::string_view block) -> std::string {
    auto lines = split_lines(block);

    std::optional<std::string> margin;
    for (const auto& line : lines) {
        if (is_blank(line)) {
            continue;
        }
        auto indent = extract_indentation(line);
        if (!margin) {
            margin = indent;
            continue;
        }
        size_t common = 0;
        while (common < margin->size() && common < indent.size()
               && (*margin)[common] == indent[common]) {
            ++common;
        }
        margin->resize(common);
    }

    for (auto& line : lines) {
        if (is_blank(line)) {
            line = "";
        } else if (margin && !margin->empty()) {
            line.erase(0, margin->size());
        }
    }

    return join(lines, "\n");
}

auto interpret_escaped_newlines(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            if (text[i + 1] == 'n') {
                result += '\n';
                ++i;
                continue;
            }
            if (text[i + 1] == 'r') {
                result += '\r';
                ++i;
                continue;
            }
        }
        result += text[i];
    }

    return result;
}

auto reescape_newlines(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());

    for (char ch : text) {
        if (ch == '\r') {
            result += "\\r";
        } else if (ch == '\n') {
            result += "\\n";
        } else {
            result += ch;
        }
    }

    return result;
}

auto count_occurrences(std::string_view haystack, std::string_view needle) -> size_t {
    if (needle.empty()) {
        return 0;
    }
    size_t count = 0;
    size_t pos = haystack.find(needle);
    while (pos != std::string_view::npos) {
        ++count;
        pos = haystack.find(needle, pos + needle.size());
    }
    return count;
}

} // namespace pyspot::text
