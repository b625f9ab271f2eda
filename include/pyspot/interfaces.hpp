#pragma once

#include <functional>
#include <optional>
#include <string>

namespace pyspot {

// Forward declarations
struct SyntaxCheckResult;
struct UIModel;
enum class InputEvent;

// Abstract interfaces for dependency injection
class ISyntaxChecker {
public:
    virtual ~ISyntaxChecker() = default;
    virtual auto check(const std::string& source) const -> SyntaxCheckResult = 0;
};

class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_text(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto write_text(const std::string& text, const std::string& path) -> bool = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
};

class ITerminal {
public:
    virtual ~ITerminal() = default;
    virtual auto is_interactive() -> bool = 0;
    virtual auto run_session(const UIModel& initial_model,
                             std::function<UIModel(UIModel, InputEvent)> update_function)
        -> UIModel = 0;
};

} // namespace pyspot
