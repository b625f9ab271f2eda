#include "pyspot/core/block_wrapper.hpp"
#include "pyspot/core/text_utils.hpp"
#include <numeric>

namespace pyspot {

BlockWrapper::BlockWrapper(const BlockSegmenter& segmenter, const ConfidenceScorer& scorer,
                           const DangerScanner& scanner, double threshold)
    : segmenter_(segmenter), scorer_(scorer), scanner_(scanner), threshold_(threshold) {}

auto BlockWrapper::wrap_code_blocks(std::string_view text, const WrapTags& tags) const -> WrapResult {
    WrapResult result;

    // One scan over the whole text so matches spanning block boundaries count
    result.dangerous = scanner_.contains_dangerous_pattern(text);

    auto lines = text::split_lines_keep_ends(text);
    auto blocks = segmenter_.form_code_blocks(lines);

    if (blocks.empty()) {
        result.text = std::string(text);
        return result;
    }

    std::string out;
    out.reserve(text.size() + blocks.size() * (tags.start.size() + tags.end.size()));
    size_t next_line = 0;
    size_t offset = 0;  // Byte offset of next_line within text

    auto copy_untouched = [&](size_t until_line) {
        for (; next_line < until_line; ++next_line) {
            offset += lines[next_line].size();
            out += lines[next_line];
        }
    };

    for (const auto& range : blocks) {
        if (range.start > next_line) {
            copy_untouched(range.start);
        }

        auto block = make_candidate_block(lines, range);
        double score = scorer_.score_block(block.text);
        result.block_scores.push_back(score);

        if (score >= threshold_ && !inside_existing_tags(text, offset, block.text, tags)) {
            out += tags.start;
            out += block.text;
            out += tags.end;
            result.did_wrap = true;
        } else {
            out += block.text;
        }

        offset += block.text.size();
        next_line = range.end + 1;
    }

    if (next_line < lines.size()) {
        copy_untouched(lines.size());
    }

    result.average_confidence = average(result.block_scores);

    // One strong block must not drag a mostly low-confidence text into wrapping
    if (result.did_wrap && result.average_confidence < threshold_) {
        result.text = std::string(text);
        result.did_wrap = false;
        result.reverted = true;
        return result;
    }

    result.text = std::move(out);
    return result;
}

auto BlockWrapper::inside_existing_tags(std::string_view text, size_t offset, const std::string& block,
                                        const WrapTags& tags) const -> bool {
    if (tags.start.empty()) {
        return false;
    }
    if (block.starts_with(tags.start)) {
        return true;
    }
    auto before = text.substr(0, offset);
    return text::count_occurrences(before, tags.start) > text::count_occurrences(before, tags.end);
}

auto average(const std::vector<double>& values) -> double {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

} // namespace pyspot
