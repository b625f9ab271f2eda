#include "pyspot/core/danger_scanner.hpp"
#include <algorithm>

namespace pyspot {

namespace {

constexpr auto kPatternFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

auto build_combined_pattern(const std::vector<DangerPattern>& patterns) -> std::string {
    std::string combined;
    for (const auto& pattern : patterns) {
        if (!combined.empty()) {
            combined += '|';
        }
        combined += "(?:" + pattern.expression + ")";
    }
    // An empty catalogue must never match
    return combined.empty() ? std::string("[^\\s\\S]") : combined;
}

} // namespace

DangerScanner::DangerScanner(std::shared_ptr<const KeywordTables> tables)
    : tables_(std::move(tables)),
      combined_(build_combined_pattern(tables_->danger_patterns), kPatternFlags) {
    patterns_.reserve(tables_->danger_patterns.size());
    for (const auto& pattern : tables_->danger_patterns) {
        patterns_.push_back({.source = &pattern, .expression = std::regex(pattern.expression, kPatternFlags)});
    }
}

auto DangerScanner::contains_dangerous_pattern(std::string_view text) const -> bool {
    return std::regex_search(text.begin(), text.end(), combined_);
}

auto DangerScanner::find_dangerous_patterns(std::string_view text) const -> std::vector<DangerMatch> {
    std::vector<DangerMatch> matches;

    for (const auto& pattern : patterns_) {
        using Iterator = std::regex_iterator<std::string_view::const_iterator>;
        for (Iterator it(text.begin(), text.end(), pattern.expression), end; it != end; ++it) {
            matches.push_back(DangerMatch{.pattern_name = pattern.source->name,
                                          .category = pattern.source->category,
                                          .matched_text = it->str(),
                                          .offset = static_cast<size_t>(it->position())});
        }
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const DangerMatch& a, const DangerMatch& b) { return a.offset < b.offset; });
    return matches;
}

} // namespace pyspot
