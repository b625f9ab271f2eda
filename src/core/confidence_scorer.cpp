#include "pyspot/core/confidence_scorer.hpp"
#include "pyspot/core/text_utils.hpp"
#include "pyspot/parsers/python_syntax_checker.hpp"

namespace pyspot {

ConfidenceScorer::ConfidenceScorer(const LineClassifier& classifier,
                                   std::shared_ptr<const ISyntaxChecker> syntax_checker)
    : classifier_(classifier), syntax_checker_(std::move(syntax_checker)) {}

auto ConfidenceScorer::score_block(std::string_view block) const -> double {
    auto uncommented = text::strip_comments(block, classifier_.tables().comment_marker);

    std::vector<std::string> code_lines;
    for (auto& line : text::split_lines(uncommented)) {
        if (!text::is_blank(line)) {
            code_lines.push_back(std::move(line));
        }
    }
    if (code_lines.empty()) {
        return kNoConfidence;
    }

    const double structured_score = code_lines.size() == 1 ? kSingleLineConfidence
                                                           : kMultiLineConfidence;

    auto dedented = text::dedent(text::join(code_lines, "\n"));
    if (syntax_checker_->check(dedented).valid) {
        return structured_score;
    }

    // Parse failed: fall back to keywords on the uncommented, non-dedented text
    if (classifier_.has_strong_keyword(text::word_tokens(uncommented))) {
        return structured_score;
    }
    return kNoConfidence;
}

} // namespace pyspot
