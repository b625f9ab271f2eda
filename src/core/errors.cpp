#include "pyspot/core/errors.hpp"

namespace pyspot {

OversizeInputError::OversizeInputError(size_t size, size_t limit)
    : DetectorError("input of " + std::to_string(size) + " bytes exceeds the "
                    + std::to_string(limit) + " byte limit"),
      size_(size), limit_(limit) {}

MalformedJsonError::MalformedJsonError(const std::string& parser_message)
    : DetectorError("malformed JSON: " + parser_message) {}

NestingTooDeepError::NestingTooDeepError(size_t max_depth)
    : DetectorError("JSON nesting exceeds " + std::to_string(max_depth) + " levels") {}

} // namespace pyspot
