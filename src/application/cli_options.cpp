#include "pyspot/application/cli_options.hpp"
#include "pyspot/core/text_utils.hpp"
#include <optional>
#include <stdexcept>

namespace pyspot {

namespace {

auto parse_double(const std::string& value) -> std::optional<double> {
    try {
        size_t consumed = 0;
        double result = std::stod(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return result;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

auto parse_size(const std::string& value) -> std::optional<size_t> {
    if (value.empty() || value.front() == '-') {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        auto result = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return static_cast<size_t>(result);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

auto error(const std::string& message) -> ParsedArgs {
    return ParsedArgs{.status = ParseStatus::ERROR, .error = message};
}

} // namespace

auto parse_args(const std::vector<std::string>& args) -> ParsedArgs {
    ParsedArgs parsed;
    auto& config = parsed.config;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        auto next_value = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                return std::nullopt;
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            parsed.status = ParseStatus::HELP;
            return parsed;
        } else if (arg == "--json") {
            config.json_mode = true;
        } else if (arg == "--parallel") {
            config.detector.parallel = true;
        } else if (arg == "--interactive") {
            config.interactive = true;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--report") {
            config.report = true;
        } else if (arg == "--fail-on-danger") {
            config.fail_on_danger = true;
        } else if (arg == "-i" || arg == "--input" || arg == "-o" || arg == "--output"
                   || arg == "--start-tag" || arg == "--end-tag" || arg == "--threshold"
                   || arg == "--max-size" || arg == "--workers") {
            auto value = next_value();
            if (!value) {
                return error("missing value for " + arg);
            }

            if (arg == "-i" || arg == "--input") {
                config.input_file = *value;
            } else if (arg == "-o" || arg == "--output") {
                config.output_file = *value;
            } else if (arg == "--start-tag") {
                config.detector.start_tag = text::interpret_escaped_newlines(*value);
            } else if (arg == "--end-tag") {
                config.detector.end_tag = text::interpret_escaped_newlines(*value);
            } else if (arg == "--threshold") {
                auto threshold = parse_double(*value);
                if (!threshold) {
                    return error("invalid threshold '" + *value + "'");
                }
                config.detector.threshold = *threshold;
            } else if (arg == "--max-size") {
                auto size = parse_size(*value);
                if (!size) {
                    return error("invalid size '" + *value + "'");
                }
                config.detector.max_input_size = *size;
            } else {
                auto workers = parse_size(*value);
                if (!workers || *workers == 0) {
                    return error("invalid worker count '" + *value + "'");
                }
                config.detector.max_workers = *workers;
            }
        } else {
            return error("unknown option " + arg);
        }
    }

    if (config.detector.start_tag.empty() || config.detector.end_tag.empty()) {
        return error("tags must not be empty");
    }
    return parsed;
}

auto usage_text() -> std::string {
    return "Usage: pyspot [options]\n"
           "  -i, --input <file>       Read input from file (default: stdin)\n"
           "  -o, --output <file>      Write result to file (default: stdout)\n"
           "      --json               Treat input as a JSON document\n"
           "      --parallel           Process JSON array elements in parallel\n"
           "      --threshold <n>      Minimum average confidence, 0-100 (default: 70)\n"
           "      --start-tag <tag>    Opening tag (default: <PythonCode>)\n"
           "      --end-tag <tag>      Closing tag (default: </PythonCode>)\n"
           "      --max-size <bytes>   Reject larger inputs (default: 5242880)\n"
           "      --workers <n>        Parallel worker limit (default: 4)\n"
           "      --interactive        Open the live preview\n"
           "      --verbose            Print detection details to stderr\n"
           "      --report             Print a summary and dangerous patterns to stderr\n"
           "      --fail-on-danger     Exit with status 3 when dangerous code is found\n"
           "  -h, --help               Show this help\n"
           "\nExamples:\n"
           "  pyspot < notes.txt > tagged.txt\n"
           "  pyspot --json --parallel -i messages.json -o tagged.json\n"
           "  pyspot --report --fail-on-danger -i snippet.txt\n";
}

} // namespace pyspot
