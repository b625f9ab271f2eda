#pragma once

#include "pyspot/core/line_classifier.hpp"
#include <string>
#include <vector>

namespace pyspot {

// Inclusive line range of a candidate code block
struct LineRange {
    size_t start{};
    size_t end{};

    auto operator==(const LineRange& other) const -> bool = default;
};

struct CandidateBlock {
    LineRange range;
    std::string text;  // Concatenated lines, terminators included
};

class BlockSegmenter {
public:
    explicit BlockSegmenter(const LineClassifier& classifier);

    // Ordered, non-overlapping ranges; lines carry their terminators
    auto form_code_blocks(const std::vector<std::string>& lines) const -> std::vector<LineRange>;
    auto form_code_blocks(std::string_view text) const -> std::vector<LineRange>;

private:
    auto continues_block(const std::string& line) const -> bool;

    const LineClassifier& classifier_;
};

auto make_candidate_block(const std::vector<std::string>& lines, LineRange range) -> CandidateBlock;

} // namespace pyspot
