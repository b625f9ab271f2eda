#include "pyspot/application/cli_options.hpp"
#include "pyspot/application/pyspot_app.hpp"
#include "pyspot/io/file_system.hpp"
#include "pyspot/ui/ftxui_terminal.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

auto main(int argc, char* argv[]) -> int {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = pyspot::parse_args(args);

    switch (parsed.status) {
    case pyspot::ParseStatus::HELP:
        std::cout << pyspot::usage_text();
        return pyspot::kExitSuccess;
    case pyspot::ParseStatus::ERROR:
        std::cerr << "Error: " << parsed.error << "\n" << pyspot::usage_text();
        return pyspot::kExitUsage;
    case pyspot::ParseStatus::OK:
        break;
    }

    pyspot::PyspotApp app(std::make_unique<pyspot::FTXUITerminal>(),
                          std::make_unique<pyspot::FileSystem>());
    return app.run(parsed.config);
}
