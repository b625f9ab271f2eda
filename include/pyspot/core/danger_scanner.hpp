#pragma once

#include "pyspot/core/keyword_tables.hpp"
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace pyspot {

struct DangerMatch {
    std::string pattern_name;
    DangerCategory category{};
    std::string matched_text;
    size_t offset{};

    auto operator==(const DangerMatch& other) const -> bool = default;
};

// Binary tripwire over the danger catalogue; independent of code-likeness
class DangerScanner {
public:
    explicit DangerScanner(std::shared_ptr<const KeywordTables> tables);

    auto contains_dangerous_pattern(std::string_view text) const -> bool;

    // Every match of every pattern, ordered by offset
    auto find_dangerous_patterns(std::string_view text) const -> std::vector<DangerMatch>;

private:
    struct CompiledPattern {
        const DangerPattern* source;
        std::regex expression;
    };

    std::shared_ptr<const KeywordTables> tables_;
    std::regex combined_;
    std::vector<CompiledPattern> patterns_;
};

} // namespace pyspot
