#pragma once

#include <string>

namespace pyspot {

// Input events from the preview session
enum class InputEvent {
    TEXT_CHANGED,
    TOGGLE_MODE,
    QUIT,
    UNKNOWN
};

enum class ViewMode {
    EDITING,
    EXIT
};

// All preview state in one place
struct UIModel {
    std::string input_text;
    std::string output_text;
    std::string start_tag;
    std::string end_tag;
    bool json_mode = false;

    // Last detection result
    double confidence{};
    bool python_detected = false;
    bool dangerous = false;
    bool reverted = false;
    std::string status_message;   // Detector errors, empty when the last run succeeded

    ViewMode mode = ViewMode::EDITING;
};

// Output text split for highlighting
struct Segment {
    std::string text;
    bool is_code = false;

    auto operator==(const Segment& other) const -> bool = default;
};

} // namespace pyspot
