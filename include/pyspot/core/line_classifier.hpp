#pragma once

#include "pyspot/core/keyword_tables.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pyspot {

class LineClassifier {
public:
    explicit LineClassifier(std::shared_ptr<const KeywordTables> tables);

    // Does this single line, taken on its own, read like a Python statement?
    auto is_line_code_like(std::string_view line) const -> bool;

    // Cheap whole-text gate run before segmentation of a string field
    auto might_contain_code(std::string_view text) const -> bool;

    auto has_strong_keyword(const std::vector<std::string>& tokens) const -> bool;

    auto tables() const -> const KeywordTables& { return *tables_; }

private:
    auto is_block_header(std::string_view stripped) const -> bool;
    auto has_foreign_marker(const std::string& lowered) const -> bool;

    std::shared_ptr<const KeywordTables> tables_;
};

} // namespace pyspot
