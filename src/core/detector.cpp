#include "pyspot/core/detector.hpp"
#include "pyspot/parsers/python_syntax_checker.hpp"
#include <algorithm>

namespace pyspot {

namespace {

auto sanitize(DetectorOptions options) -> DetectorOptions {
    options.threshold = std::clamp(options.threshold, 0.0, 100.0);
    options.max_workers = std::max<size_t>(options.max_workers, 1);
    return options;
}

auto tables_or_default(std::shared_ptr<const KeywordTables> tables)
    -> std::shared_ptr<const KeywordTables> {
    if (tables) {
        return tables;
    }
    return std::make_shared<const KeywordTables>(KeywordTables::python());
}

auto checker_or_default(std::shared_ptr<const ISyntaxChecker> checker)
    -> std::shared_ptr<const ISyntaxChecker> {
    if (checker) {
        return checker;
    }
    return std::make_shared<const PythonSyntaxChecker>();
}

} // namespace

Detector::Detector(DetectorOptions options, std::shared_ptr<const KeywordTables> tables,
                   std::shared_ptr<const ISyntaxChecker> syntax_checker)
    : options_(sanitize(std::move(options))),
      tables_(tables_or_default(std::move(tables))),
      syntax_checker_(checker_or_default(std::move(syntax_checker))),
      classifier_(tables_),
      scanner_(tables_),
      segmenter_(classifier_),
      scorer_(classifier_, syntax_checker_),
      wrapper_(segmenter_, scorer_, scanner_, options_.threshold),
      field_processor_(wrapper_, classifier_, scanner_),
      walker_(field_processor_, options_.max_workers, options_.max_depth) {}

auto Detector::detect(const std::string& text) const -> TextDetection {
    return detect(text, options_.start_tag, options_.end_tag);
}

auto Detector::detect(const std::string& text, const std::string& start_tag,
                      const std::string& end_tag) const -> TextDetection {
    enforce_size_cap(text);

    auto wrapped = wrapper_.wrap_code_blocks(text, WrapTags{.start = start_tag, .end = end_tag});

    return TextDetection{.text = std::move(wrapped.text),
                         .confidence = wrapped.average_confidence,
                         .python_detected = wrapped.did_wrap,
                         .dangerous = wrapped.dangerous,
                         .reverted = wrapped.reverted};
}

auto Detector::detect_json(const std::string& document) const -> JsonDetection {
    return detect_json(document, options_.start_tag, options_.end_tag, options_.parallel);
}

auto Detector::detect_json(const std::string& document, const std::string& start_tag,
                           const std::string& end_tag, bool parallel) const -> JsonDetection {
    enforce_size_cap(document);

    OrderedJson parsed;
    try {
        parsed = OrderedJson::parse(document);
    } catch (const nlohmann::json::exception& e) {
        // parse_error for bad syntax, out_of_range for numbers that overflow a double
        throw MalformedJsonError(e.what());
    }

    auto walked = walker_.wrap_code_in_json(parsed, WrapTags{.start = start_tag, .end = end_tag},
                                            parallel);

    JsonDetection detection{.document = document,
                            .confidences = std::move(walked.confidences),
                            .confidence = 0.0,
                            .python_detected = false,
                            .changed = walked.changed,
                            .dangerous = walked.dangerous,
                            .reverted = false};
    detection.confidence = average(detection.confidences);

    if (walked.did_wrap && detection.confidence < options_.threshold) {
        detection.reverted = true;
        return detection;
    }
    if (!walked.changed) {
        return detection;
    }

    detection.python_detected = true;
    detection.document = walked.value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return detection;
}

auto Detector::find_dangerous_patterns(const std::string& text) const -> std::vector<DangerMatch> {
    return scanner_.find_dangerous_patterns(text);
}

auto Detector::enforce_size_cap(const std::string& input) const -> void {
    if (input.size() > options_.max_input_size) {
        throw OversizeInputError(input.size(), options_.max_input_size);
    }
}

} // namespace pyspot
