#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace pyspot {

// Base for every refusal surfaced by the detector facade
class DetectorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class OversizeInputError : public DetectorError {
public:
    OversizeInputError(size_t size, size_t limit);

    auto size() const -> size_t { return size_; }
    auto limit() const -> size_t { return limit_; }

private:
    size_t size_;
    size_t limit_;
};

class MalformedJsonError : public DetectorError {
public:
    explicit MalformedJsonError(const std::string& parser_message);
};

class NestingTooDeepError : public DetectorError {
public:
    explicit NestingTooDeepError(size_t max_depth);
};

} // namespace pyspot
