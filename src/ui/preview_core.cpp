#include "pyspot/ui/preview_core.hpp"
#include "pyspot/core/errors.hpp"
#include <iomanip>
#include <sstream>

namespace pyspot::preview {

namespace {

auto yes_no(bool value) -> std::string {
    return value ? "yes" : "no";
}

auto clear_result(UIModel& model) -> void {
    model.output_text.clear();
    model.confidence = 0.0;
    model.python_detected = false;
    model.dangerous = false;
    model.reverted = false;
}

} // namespace

auto sample_text() -> std::string {
    return "The survey data came back on Tuesday\n"
           "and most of the readings looked fine,\n"
           "so we fitted a curve before lunch:\n"
           "import numpy as np\n"
           "\n"
           "def fit_quadratic(x, y):\n"
           "    design = np.vstack((x**2, x, np.ones(len(x)))).T\n"
           "    a, b, c = np.linalg.lstsq(design, y, rcond=None)[0]\n"
           "    return a, b, c\n"
           "\n"
           "if __name__ == '__main__':\n"
           "    xs = np.array([0.0, 1.0, 2.0, 3.0])\n"
           "    ys = np.array([1.0, 2.1, 4.9, 10.2])\n"
           "    print(fit_quadratic(xs, ys))\n"
           "The residuals were small enough\n"
           "that nobody wanted a second look.\n";
}

auto initial_model(const Detector& detector) -> UIModel {
    UIModel model;
    model.input_text = sample_text();
    model.start_tag = detector.options().start_tag;
    model.end_tag = detector.options().end_tag;
    return refresh(std::move(model), detector);
}

auto update(UIModel model, InputEvent event, const Detector& detector) -> UIModel {
    switch (event) {
    case InputEvent::TEXT_CHANGED:
        return refresh(std::move(model), detector);
    case InputEvent::TOGGLE_MODE:
        model.json_mode = !model.json_mode;
        return refresh(std::move(model), detector);
    case InputEvent::QUIT:
        model.mode = ViewMode::EXIT;
        return model;
    case InputEvent::UNKNOWN:
        break;
    }
    return model;
}

auto refresh(UIModel model, const Detector& detector) -> UIModel {
    try {
        if (model.json_mode) {
            auto result = detector.detect_json(model.input_text, model.start_tag, model.end_tag,
                                               detector.options().parallel);
            model.output_text = std::move(result.document);
            model.confidence = result.confidence;
            model.python_detected = result.python_detected;
            model.dangerous = result.dangerous;
            model.reverted = result.reverted;
        } else {
            auto result = detector.detect(model.input_text, model.start_tag, model.end_tag);
            model.output_text = std::move(result.text);
            model.confidence = result.confidence;
            model.python_detected = result.python_detected;
            model.dangerous = result.dangerous;
            model.reverted = result.reverted;
        }
        model.status_message.clear();
    } catch (const DetectorError& e) {
        clear_result(model);
        model.status_message = e.what();
    }
    return model;
}

auto status_line(const UIModel& model) -> std::string {
    std::ostringstream line;
    line << "Mode: " << (model.json_mode ? "JSON" : "text") << " | Confidence: " << std::fixed
         << std::setprecision(1) << model.confidence
         << " | Python: " << yes_no(model.python_detected)
         << " | Reverted: " << yes_no(model.reverted)
         << " | Danger: " << yes_no(model.dangerous);
    if (!model.status_message.empty()) {
        line << " | " << model.status_message;
    }
    return line.str();
}

auto split_tagged_segments(std::string_view text, std::string_view start_tag,
                           std::string_view end_tag) -> std::vector<Segment> {
    std::vector<Segment> segments;
    auto push = [&segments](std::string_view piece, bool is_code) {
        if (!piece.empty()) {
            segments.push_back(Segment{.text = std::string(piece), .is_code = is_code});
        }
    };

    if (start_tag.empty() || end_tag.empty()) {
        push(text, false);
        return segments;
    }

    size_t pos = 0;
    while (pos < text.size()) {
        auto open = text.find(start_tag, pos);
        if (open == std::string_view::npos) {
            break;
        }
        auto close = text.find(end_tag, open + start_tag.size());
        if (close == std::string_view::npos) {
            break;
        }

        push(text.substr(pos, open - pos), false);
        auto region_end = close + end_tag.size();
        push(text.substr(open, region_end - open), true);
        pos = region_end;
    }

    if (pos < text.size()) {
        push(text.substr(pos), false);
    }
    return segments;
}

} // namespace pyspot::preview
