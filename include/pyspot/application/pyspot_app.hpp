#pragma once

#include "pyspot/core/detector.hpp"
#include "pyspot/interfaces.hpp"
#include <memory>
#include <optional>
#include <string>

namespace pyspot {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitDangerous = 3;

struct Config {
    std::string input_file = "-";    // stdin by default
    std::string output_file = "-";   // stdout by default
    bool json_mode = false;
    bool interactive = false;
    bool verbose = false;
    bool report = false;
    bool fail_on_danger = false;
    DetectorOptions detector;
};

class PyspotApp {
private:
    std::unique_ptr<ITerminal> terminal_;
    std::unique_ptr<IFileSystem> filesystem_;

public:
    PyspotApp(std::unique_ptr<ITerminal> terminal, std::unique_ptr<IFileSystem> filesystem);

    auto run(const Config& config) -> int;

private:
    auto run_interactive(const Detector& detector) -> int;
    auto run_batch(const Config& config, const Detector& detector) -> int;

    auto load_input(const Config& config) -> std::optional<std::string>;
    auto write_output(const std::string& text, const Config& config) -> bool;
    auto report_dangers(const Detector& detector, const std::string& input) -> void;
};

} // namespace pyspot
