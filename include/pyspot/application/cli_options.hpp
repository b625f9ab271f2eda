#pragma once

#include "pyspot/application/pyspot_app.hpp"
#include <string>
#include <vector>

namespace pyspot {

enum class ParseStatus {
    OK,
    HELP,
    ERROR
};

struct ParsedArgs {
    ParseStatus status = ParseStatus::OK;
    Config config;
    std::string error;   // Set when status == ERROR
};

// args excludes the program name
auto parse_args(const std::vector<std::string>& args) -> ParsedArgs;

auto usage_text() -> std::string;

} // namespace pyspot
