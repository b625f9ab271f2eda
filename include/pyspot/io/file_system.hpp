#pragma once

#include "pyspot/interfaces.hpp"
#include <optional>
#include <string>

namespace pyspot {

class FileSystem : public IFileSystem {
public:
    // Reads the whole file as raw bytes; nullopt if it cannot be opened
    auto read_text(const std::string& path) -> std::optional<std::string> override;
    auto write_text(const std::string& text, const std::string& path) -> bool override;
    auto file_exists(const std::string& path) -> bool override;

private:
    auto write_atomic(const std::string& text, const std::string& path) -> bool;
};

} // namespace pyspot
