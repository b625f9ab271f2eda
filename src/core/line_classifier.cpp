#include "pyspot/core/line_classifier.hpp"
#include "pyspot/core/text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace pyspot {

namespace {

constexpr size_t kMinimumLineLength = 3;

auto is_word_char(char ch) -> bool {
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_';
}

} // namespace

LineClassifier::LineClassifier(std::shared_ptr<const KeywordTables> tables)
    : tables_(std::move(tables)) {}

auto LineClassifier::is_line_code_like(std::string_view line) const -> bool {
    std::string stripped = text::trim(line);
    if (stripped.size() < kMinimumLineLength) {
        return false;
    }

    auto comment = stripped.find(tables_->comment_marker);
    if (comment != std::string::npos) {
        std::string partial = text::trim(std::string_view(stripped).substr(0, comment));
        if (partial.size() < kMinimumLineLength) {
            return false;
        }
        stripped = std::move(partial);
    }

    // Other language families veto everything else
    if (has_foreign_marker(text::to_lowercase(stripped))) {
        return false;
    }
    if (stripped.find_first_of(tables_->foreign_punctuation) != std::string::npos) {
        return false;
    }

    if (is_block_header(stripped)) {
        return true;
    }

    return has_strong_keyword(text::word_tokens(stripped));
}

auto LineClassifier::might_contain_code(std::string_view text) const -> bool {
    auto lowered = text::to_lowercase(text);

    // JavaScript-looking text gets no benefit of the doubt: like everything
    // else it passes only on a strong keyword, never on markers or weak words
    return has_strong_keyword(text::word_tokens(lowered));
}

auto LineClassifier::has_strong_keyword(const std::vector<std::string>& tokens) const -> bool {
    return std::any_of(tokens.begin(), tokens.end(),
                       [this](const std::string& token) { return tables_->is_strong_keyword(token); });
}

auto LineClassifier::is_block_header(std::string_view stripped) const -> bool {
    // "for x in y:" style headers: a header keyword as the first word, a colon at the end
    if (stripped.empty() || stripped.back() != ':') {
        return false;
    }
    return std::any_of(tables_->block_keywords.begin(), tables_->block_keywords.end(),
                       [stripped](const std::string& keyword) {
                           return stripped.starts_with(keyword)
                                  && (stripped.size() == keyword.size() || !is_word_char(stripped[keyword.size()]));
                       });
}

auto LineClassifier::has_foreign_marker(const std::string& lowered) const -> bool {
    return std::any_of(tables_->foreign_markers.begin(), tables_->foreign_markers.end(),
                       [&lowered](const std::string& marker) {
                           return lowered.find(marker) != std::string::npos;
                       });
}

} // namespace pyspot
