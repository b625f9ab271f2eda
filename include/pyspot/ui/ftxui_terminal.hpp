#pragma once

#include "pyspot/interfaces.hpp"
#include "pyspot/ui/ui_model.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>

#include <functional>

namespace pyspot {

class FTXUITerminal : public ITerminal {
public:
    FTXUITerminal() = default;

    // Single full-screen session at a time
    FTXUITerminal(const FTXUITerminal&) = delete;
    auto operator=(const FTXUITerminal&) -> FTXUITerminal& = delete;

    auto is_interactive() -> bool override;
    auto run_session(const UIModel& initial_model,
                     std::function<UIModel(UIModel, InputEvent)> update_function)
        -> UIModel override;

private:
    auto compose_screen(const UIModel& model, ftxui::Component& input) -> ftxui::Element;
    auto compose_output_pane(const UIModel& model) -> ftxui::Element;
    auto compose_status(const UIModel& model) -> ftxui::Element;
};

} // namespace pyspot
