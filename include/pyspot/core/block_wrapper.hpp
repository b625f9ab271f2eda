#pragma once

#include "pyspot/core/block_segmenter.hpp"
#include "pyspot/core/confidence_scorer.hpp"
#include "pyspot/core/danger_scanner.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace pyspot {

struct WrapTags {
    std::string start;
    std::string end;
};

struct WrapResult {
    std::string text;
    double average_confidence{};
    bool did_wrap = false;
    bool reverted = false;       // Some block cleared the threshold but the mean did not
    bool dangerous = false;
    std::vector<double> block_scores;
};

class BlockWrapper {
public:
    BlockWrapper(const BlockSegmenter& segmenter, const ConfidenceScorer& scorer,
                 const DangerScanner& scanner, double threshold);

    auto wrap_code_blocks(std::string_view text, const WrapTags& tags) const -> WrapResult;

    auto threshold() const -> double { return threshold_; }

private:
    auto inside_existing_tags(std::string_view text, size_t offset, const std::string& block,
                              const WrapTags& tags) const -> bool;

    const BlockSegmenter& segmenter_;
    const ConfidenceScorer& scorer_;
    const DangerScanner& scanner_;
    double threshold_;
};

auto average(const std::vector<double>& values) -> double;

} // namespace pyspot
