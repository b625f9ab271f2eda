#pragma once

#include "pyspot/core/block_wrapper.hpp"
#include <string>
#include <vector>

namespace pyspot {

struct FieldResult {
    std::string value;
    std::vector<double> confidences;  // Empty when the field was never scored
    bool did_wrap = false;
    bool changed = false;
    bool dangerous = false;
};

// Applies the wrapper to one JSON string leaf
class StringFieldProcessor {
public:
    static constexpr size_t kMinimumFieldLength = 5;

    StringFieldProcessor(const BlockWrapper& wrapper, const LineClassifier& classifier,
                         const DangerScanner& scanner);

    auto process(const std::string& original, const WrapTags& tags) const -> FieldResult;

private:
    const BlockWrapper& wrapper_;
    const LineClassifier& classifier_;
    const DangerScanner& scanner_;
};

} // namespace pyspot
