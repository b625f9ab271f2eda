#pragma once

#include "pyspot/core/block_wrapper.hpp"
#include "pyspot/core/errors.hpp"
#include "pyspot/core/string_field_processor.hpp"
#include "pyspot/json/json_walker.hpp"
#include <memory>
#include <string>
#include <vector>

namespace pyspot {

struct DetectorOptions {
    std::string start_tag = "<PythonCode>";
    std::string end_tag = "</PythonCode>";
    double threshold = 70.0;                   // Clamped to [0, 100]
    bool parallel = false;
    size_t max_input_size = 5 * 1024 * 1024;   // Bytes
    size_t max_workers = 4;
    size_t max_depth = 256;                    // JSON nesting guard
};

struct TextDetection {
    std::string text;
    double confidence{};
    bool python_detected = false;
    bool dangerous = false;
    bool reverted = false;
};

struct JsonDetection {
    std::string document;
    std::vector<double> confidences;
    double confidence{};
    bool python_detected = false;
    bool changed = false;
    bool dangerous = false;
    bool reverted = false;
};

// Text-in/text-out entry points. Stateless per call, safe to share between threads.
class Detector {
public:
    explicit Detector(DetectorOptions options = {},
                      std::shared_ptr<const KeywordTables> tables = nullptr,
                      std::shared_ptr<const ISyntaxChecker> syntax_checker = nullptr);

    // Components hold references into each other
    Detector(const Detector&) = delete;
    auto operator=(const Detector&) -> Detector& = delete;

    auto detect(const std::string& text) const -> TextDetection;
    auto detect(const std::string& text, const std::string& start_tag,
                const std::string& end_tag) const -> TextDetection;

    auto detect_json(const std::string& document) const -> JsonDetection;
    auto detect_json(const std::string& document, const std::string& start_tag,
                     const std::string& end_tag, bool parallel) const -> JsonDetection;

    auto find_dangerous_patterns(const std::string& text) const -> std::vector<DangerMatch>;

    auto options() const -> const DetectorOptions& { return options_; }

private:
    auto enforce_size_cap(const std::string& input) const -> void;

    DetectorOptions options_;
    std::shared_ptr<const KeywordTables> tables_;
    std::shared_ptr<const ISyntaxChecker> syntax_checker_;
    LineClassifier classifier_;
    DangerScanner scanner_;
    BlockSegmenter segmenter_;
    ConfidenceScorer scorer_;
    BlockWrapper wrapper_;
    StringFieldProcessor field_processor_;
    JsonWalker walker_;
};

} // namespace pyspot
