#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace pyspot {

enum class DangerCategory {
    PROCESS_EXECUTION,
    DYNAMIC_EVALUATION,
    FILESYSTEM_DESTRUCTION,
    PROCESS_TERMINATION,
    NETWORK_ACCESS,
    UNSAFE_DESERIALIZATION
};

struct DangerPattern {
    std::string name;
    DangerCategory category{};
    std::string expression;  // ECMAScript regex, matched case-insensitively
};

// Immutable detection vocabulary, shared read-only between components
struct KeywordTables {
    // Keywords that reliably mark a line as code
    std::unordered_set<std::string> strong_keywords;
    // Too common in prose to count on their own
    std::unordered_set<std::string> weak_keywords;
    // Substrings (matched on lower-cased text) that betray another language family
    std::vector<std::string> foreign_markers;
    // Any of these characters rejects a line outright
    std::string foreign_punctuation;
    // Leading keywords of a compound statement header ("for x in y:")
    std::vector<std::string> block_keywords;
    char comment_marker = '#';
    std::vector<DangerPattern> danger_patterns;

    static auto python() -> KeywordTables;

    auto is_strong_keyword(const std::string& token) const -> bool;
};

auto category_display_name(DangerCategory category) -> std::string;

} // namespace pyspot
