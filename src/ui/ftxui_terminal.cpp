#include "pyspot/ui/ftxui_terminal.hpp"
#include "pyspot/ui/preview_core.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/component_options.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <cstdio>
#include <string>
#include <unistd.h>

namespace pyspot {

auto FTXUITerminal::is_interactive() -> bool {
    return isatty(fileno(stdin)) && isatty(fileno(stdout));
}

auto FTXUITerminal::run_session(const UIModel& initial_model,
                                std::function<UIModel(UIModel, InputEvent)> update_function)
    -> UIModel {
    using namespace ftxui;

    auto current_model = initial_model;
    auto screen = ScreenInteractive::Fullscreen();

    // The Input widget edits this buffer; the model is refreshed from it on every change
    std::string input_buffer = current_model.input_text;

    InputOption input_option;
    input_option.on_change = [&] {
        current_model.input_text = input_buffer;
        current_model = update_function(current_model, InputEvent::TEXT_CHANGED);
    };
    auto input = Input(&input_buffer, "Paste text or JSON here", input_option);

    auto quit = [&] {
        current_model = update_function(current_model, InputEvent::QUIT);
        if (current_model.mode == ViewMode::EXIT) {
            screen.ExitLoopClosure()();
        }
    };

    auto component = CatchEvent(Renderer(input, [&] { return compose_screen(current_model, input); }),
                                [&](Event event) -> bool {
                                    if (event == Event::Escape || event == Event::Special("\x11")) {
                                        quit();
                                        return true;
                                    }
                                    if (event == Event::Tab) {
                                        current_model = update_function(current_model, InputEvent::TOGGLE_MODE);
                                        return true;
                                    }
                                    return false; // Let the Input component handle it
                                });

    screen.Loop(component);
    return current_model;
}

auto FTXUITerminal::compose_screen(const UIModel& model, ftxui::Component& input) -> ftxui::Element {
    using namespace ftxui;

    auto header = text("=== pyspot: Python snippet preview ===") | bold | center;
    auto input_pane = window(text(model.json_mode ? " Input (JSON) " : " Input (text) "),
                             input->Render() | frame | vscroll_indicator);
    auto output_pane = window(text(" Processed result "), compose_output_pane(model) | frame | vscroll_indicator);
    auto hints = text("Edit the input above. Toggle text/JSON [Tab] Quit [Esc] [Ctrl-Q]") | dim;

    return vbox({
        header,
        input_pane | flex,
        output_pane | flex,
        separator(),
        compose_status(model),
        hints
    });
}

auto FTXUITerminal::compose_output_pane(const UIModel& model) -> ftxui::Element {
    using namespace ftxui;

    Elements rows;
    Elements row;

    auto flush_row = [&] {
        rows.push_back(hbox(std::move(row)));
        row = Elements{};
    };

    for (const auto& segment : preview::split_tagged_segments(model.output_text, model.start_tag, model.end_tag)) {
        size_t pos = 0;
        while (pos <= segment.text.size()) {
            auto newline = segment.text.find('\n', pos);
            auto piece = segment.text.substr(pos, newline == std::string::npos ? std::string::npos : newline - pos);

            if (!piece.empty()) {
                auto element = text(piece);
                if (segment.is_code) {
                    element = element | color(Color::Blue) | bold;
                }
                row.push_back(element);
            }

            if (newline == std::string::npos) {
                break;
            }
            flush_row();
            pos = newline + 1;
        }
    }
    if (!row.empty()) {
        flush_row();
    }

    if (rows.empty()) {
        return text("(no output)") | dim;
    }
    return vbox(std::move(rows));
}

auto FTXUITerminal::compose_status(const UIModel& model) -> ftxui::Element {
    using namespace ftxui;

    auto status = text(preview::status_line(model)) | bold;
    if (!model.status_message.empty()) {
        return status | color(Color::Red);
    }
    if (model.dangerous) {
        return status | color(Color::Yellow);
    }
    return status | color(Color::Cyan);
}

} // namespace pyspot
