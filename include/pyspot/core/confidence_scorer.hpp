#pragma once

#include "pyspot/core/line_classifier.hpp"
#include "pyspot/interfaces.hpp"
#include <memory>
#include <string_view>

namespace pyspot {

// The three levels a block can score
inline constexpr double kNoConfidence = 0.0;
inline constexpr double kSingleLineConfidence = 80.0;
inline constexpr double kMultiLineConfidence = 100.0;

class ConfidenceScorer {
public:
    ConfidenceScorer(const LineClassifier& classifier,
                     std::shared_ptr<const ISyntaxChecker> syntax_checker);

    auto score_block(std::string_view block) const -> double;

private:
    const LineClassifier& classifier_;
    std::shared_ptr<const ISyntaxChecker> syntax_checker_;
};

} // namespace pyspot
