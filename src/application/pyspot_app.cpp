#include "pyspot/application/pyspot_app.hpp"
#include "pyspot/core/errors.hpp"
#include "pyspot/core/keyword_tables.hpp"
#include "pyspot/ui/preview_core.hpp"
#include <iostream>
#include <iterator>
#include <utility>

namespace pyspot {

namespace {

// Common shape of a text or JSON detection for reporting
struct Outcome {
    std::string output;
    double confidence{};
    bool python_detected = false;
    bool changed = false;
    bool dangerous = false;
    bool reverted = false;
};

auto describe_input(const std::string& path) -> std::string {
    return path == "-" ? "stdin" : path;
}

} // namespace

PyspotApp::PyspotApp(std::unique_ptr<ITerminal> terminal, std::unique_ptr<IFileSystem> filesystem)
    : terminal_(std::move(terminal)), filesystem_(std::move(filesystem)) {}

auto PyspotApp::run(const Config& config) -> int {
    Detector detector(config.detector);

    if (config.interactive) {
        if (!terminal_->is_interactive()) {
            std::cerr << "Error: Interactive mode requires a terminal\n";
            return kExitFailure;
        }
        return run_interactive(detector);
    }

    return run_batch(config, detector);
}

auto PyspotApp::run_interactive(const Detector& detector) -> int {
    auto final_model = terminal_->run_session(preview::initial_model(detector),
                                              [&detector](UIModel model, InputEvent event) {
                                                  return preview::update(std::move(model), event, detector);
                                              });

    if (!final_model.status_message.empty()) {
        std::cerr << "Warning: Last preview run failed: " << final_model.status_message << "\n";
    }
    return kExitSuccess;
}

auto PyspotApp::run_batch(const Config& config, const Detector& detector) -> int {
    auto input = load_input(config);
    if (!input) {
        std::cerr << "Error: Could not read input from " << describe_input(config.input_file) << "\n";
        return kExitFailure;
    }

    Outcome outcome;
    try {
        if (config.json_mode) {
            auto result = detector.detect_json(*input);
            outcome = Outcome{.output = std::move(result.document),
                              .confidence = result.confidence,
                              .python_detected = result.python_detected,
                              .changed = result.changed,
                              .dangerous = result.dangerous,
                              .reverted = result.reverted};
        } else {
            auto result = detector.detect(*input);
            bool changed = result.text != *input;
            outcome = Outcome{.output = std::move(result.text),
                              .confidence = result.confidence,
                              .python_detected = result.python_detected,
                              .changed = changed,
                              .dangerous = result.dangerous,
                              .reverted = result.reverted};
        }
    } catch (const DetectorError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitFailure;
    }

    if (!write_output(outcome.output, config)) {
        std::cerr << "Error: Could not write output to " << config.output_file << "\n";
        return kExitFailure;
    }

    if (config.verbose) {
        std::cerr << "Debug: confidence=" << outcome.confidence
                  << " threshold=" << detector.options().threshold
                  << " wrapped=" << outcome.python_detected
                  << " changed=" << outcome.changed
                  << " dangerous=" << outcome.dangerous << "\n";
        if (outcome.reverted) {
            std::cerr << "Warning: Average confidence " << outcome.confidence
                      << " is below threshold " << detector.options().threshold
                      << ", wrapping reverted\n";
        }
    }

    if (config.report) {
        std::cerr << "Summary: mode=" << (config.json_mode ? "json" : "text")
                  << " confidence=" << outcome.confidence
                  << " python_detected=" << (outcome.python_detected ? "yes" : "no")
                  << " dangerous=" << (outcome.dangerous ? "yes" : "no") << "\n";
        if (outcome.dangerous) {
            report_dangers(detector, *input);
        }
    }

    if (config.fail_on_danger && outcome.dangerous) {
        return kExitDangerous;
    }
    return kExitSuccess;
}

auto PyspotApp::load_input(const Config& config) -> std::optional<std::string> {
    if (config.input_file == "-") {
        std::string content((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        if (std::cin.bad()) {
            return std::nullopt;
        }
        return content;
    }

    if (!filesystem_->file_exists(config.input_file)) {
        return std::nullopt;
    }
    return filesystem_->read_text(config.input_file);
}

auto PyspotApp::write_output(const std::string& text, const Config& config) -> bool {
    if (config.output_file == "-") {
        std::cout << text << std::flush;
        return !std::cout.fail();
    }
    return filesystem_->write_text(text, config.output_file);
}

auto PyspotApp::report_dangers(const Detector& detector, const std::string& input) -> void {
    for (const auto& match : detector.find_dangerous_patterns(input)) {
        std::cerr << "Warning: Dangerous pattern '" << match.pattern_name << "' ("
                  << category_display_name(match.category) << ") at offset " << match.offset
                  << ": " << match.matched_text << "\n";
    }
}

} // namespace pyspot
