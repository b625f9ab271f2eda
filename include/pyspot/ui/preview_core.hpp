#pragma once

#include "pyspot/core/detector.hpp"
#include "pyspot/ui/ui_model.hpp"
#include <string>
#include <string_view>
#include <vector>

// Pure functions behind the interactive preview
namespace pyspot::preview {

auto sample_text() -> std::string;

// Model pre-filled with the sample and its detection result
auto initial_model(const Detector& detector) -> UIModel;

auto update(UIModel model, InputEvent event, const Detector& detector) -> UIModel;

// Re-runs the detector on input_text in the current mode
auto refresh(UIModel model, const Detector& detector) -> UIModel;

auto status_line(const UIModel& model) -> std::string;

// Tagged regions (tags included) become code segments; an unterminated start
// tag is left as plain text. Empty segments are never produced.
auto split_tagged_segments(std::string_view text, std::string_view start_tag,
                           std::string_view end_tag) -> std::vector<Segment>;

} // namespace pyspot::preview
