#include "pyspot/core/block_segmenter.hpp"
#include "pyspot/core/text_utils.hpp"

namespace pyspot {

BlockSegmenter::BlockSegmenter(const LineClassifier& classifier) : classifier_(classifier) {}

auto BlockSegmenter::form_code_blocks(const std::vector<std::string>& lines) const
    -> std::vector<LineRange> {
    std::vector<LineRange> blocks;
    bool in_block = false;
    size_t block_start = 0;

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];

        if (in_block) {
            if (continues_block(line)) {
                continue;
            }
            // Plainly not code, not blank, not indented: close at the previous line.
            // This line is not reconsidered as an opener.
            blocks.push_back({.start = block_start, .end = i - 1});
            in_block = false;
        } else if (classifier_.is_line_code_like(line)) {
            in_block = true;
            block_start = i;
        }
    }

    if (in_block) {
        blocks.push_back({.start = block_start, .end = lines.size() - 1});
    }

    return blocks;
}

auto BlockSegmenter::form_code_blocks(std::string_view text) const -> std::vector<LineRange> {
    return form_code_blocks(text::split_lines_keep_ends(text));
}

auto BlockSegmenter::continues_block(const std::string& line) const -> bool {
    if (classifier_.is_line_code_like(line) || text::is_blank(line)) {
        return true;
    }
    return !line.empty() && (line.front() == ' ' || line.front() == '\t');
}

auto make_candidate_block(const std::vector<std::string>& lines, LineRange range) -> CandidateBlock {
    CandidateBlock block{.range = range, .text = {}};
    for (size_t i = range.start; i <= range.end && i < lines.size(); ++i) {
        block.text += lines[i];
    }
    return block;
}

} // namespace pyspot
