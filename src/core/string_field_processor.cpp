#include "pyspot/core/string_field_processor.hpp"
#include "pyspot/core/text_utils.hpp"

namespace pyspot {

StringFieldProcessor::StringFieldProcessor(const BlockWrapper& wrapper,
                                           const LineClassifier& classifier,
                                           const DangerScanner& scanner)
    : wrapper_(wrapper), classifier_(classifier), scanner_(scanner) {}

auto StringFieldProcessor::process(const std::string& original, const WrapTags& tags) const
    -> FieldResult {
    FieldResult result{.value = original};

    if (text::trim(original).size() < kMinimumFieldLength) {
        return result;
    }

    // Payloads often carry a whole snippet as one line with escaped newlines
    auto unescaped = text::interpret_escaped_newlines(original);

    bool dangerous = scanner_.contains_dangerous_pattern(unescaped);
    if (!dangerous && !classifier_.might_contain_code(unescaped)) {
        return result;
    }

    auto wrapped = wrapper_.wrap_code_blocks(unescaped, tags);
    result.dangerous = dangerous || wrapped.dangerous;
    result.confidences.push_back(wrapped.average_confidence);

    if (wrapped.did_wrap) {
        auto reescaped = text::reescape_newlines(wrapped.text);
        result.changed = reescaped != original;
        result.did_wrap = true;
        result.value = std::move(reescaped);
    }

    return result;
}

} // namespace pyspot
