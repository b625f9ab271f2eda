#include "pyspot/io/file_system.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace pyspot {

auto FileSystem::read_text(const std::string& path) -> std::optional<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return content;
}

auto FileSystem::write_text(const std::string& text, const std::string& path) -> bool {
    return write_atomic(text, path);
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code error;
    return std::filesystem::exists(path, error);
}

auto FileSystem::write_atomic(const std::string& text, const std::string& path) -> bool {
    // Write to temporary file first for atomic replacement
    std::string temp_path = path + ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }
        file << text;
        file.flush();
        if (file.fail()) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return false;
        }
    }

    std::error_code error;
    std::filesystem::rename(temp_path, path, error);
    if (error) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return false;
    }
    return true;
}

} // namespace pyspot
