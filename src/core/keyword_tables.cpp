#include "pyspot/core/keyword_tables.hpp"

namespace pyspot {

auto KeywordTables::python() -> KeywordTables {
    KeywordTables tables;

    tables.strong_keywords = {"def",    "class",  "import", "from",     "if",     "elif",
                              "else",   "try",    "except", "with",     "for",    "while",
                              "return", "print",  "lambda", "yield",    "assert", "nonlocal",
                              "global", "raise",  "async",  "await",    "pass",   "continue",
                              "break"};

    tables.weak_keywords = {"in", "is", "and", "or", "not"};

    // JavaScript and friends
    tables.foreign_markers = {"function ", "console."};
    tables.foreign_punctuation = "{};";

    tables.block_keywords = {"def", "class", "if",      "elif", "else", "try",
                             "except", "finally", "with", "for",  "while"};

    // Quantifiers stay bounded: std::regex recurses once per repeated character
    tables.danger_patterns = {
        {.name = "os.system",
         .category = DangerCategory::PROCESS_EXECUTION,
         .expression = R"(\bos\.system\s{0,32}\()"},
        {.name = "os.popen/exec/spawn",
         .category = DangerCategory::PROCESS_EXECUTION,
         .expression = R"(\bos\.(?:popen|exec[lv]p?e?|spawn[lv]p?e?)\s{0,32}\()"},
        {.name = "subprocess",
         .category = DangerCategory::PROCESS_EXECUTION,
         .expression = R"(\bsubprocess\.(?:run|call|Popen|check_output|check_call))"},
        {.name = "eval",
         .category = DangerCategory::DYNAMIC_EVALUATION,
         .expression = R"(\beval\s{0,32}\()"},
        {.name = "exec",
         .category = DangerCategory::DYNAMIC_EVALUATION,
         .expression = R"(\bexec\s{0,32}\()"},
        {.name = "shutil.rmtree",
         .category = DangerCategory::FILESYSTEM_DESTRUCTION,
         .expression = R"(\bshutil\.rmtree\s{0,32}\()"},
        {.name = "rm -rf",
         .category = DangerCategory::FILESYSTEM_DESTRUCTION,
         .expression = R"(rm\s{1,32}-rf)"},
        {.name = "kill -9",
         .category = DangerCategory::PROCESS_TERMINATION,
         .expression = R"(\bkill\s{1,32}-9\b)"},
        {.name = "urllib",
         .category = DangerCategory::NETWORK_ACCESS,
         .expression = R"(\burllib\.(?:request|urlopen))"},
        {.name = "requests",
         .category = DangerCategory::NETWORK_ACCESS,
         .expression = R"(\brequests?\.[A-Za-z_]{1,64})"},
        {.name = "socket",
         .category = DangerCategory::NETWORK_ACCESS,
         .expression = R"(\bsocket\.[A-Za-z_]{1,64})"},
        {.name = "pickle",
         .category = DangerCategory::UNSAFE_DESERIALIZATION,
         .expression = R"(\bpickle\.(?:load|loads))"},
        {.name = "marshal",
         .category = DangerCategory::UNSAFE_DESERIALIZATION,
         .expression = R"(\bmarshal\.(?:load|loads))"},
    };

    return tables;
}

auto KeywordTables::is_strong_keyword(const std::string& token) const -> bool {
    return strong_keywords.contains(token);
}

auto category_display_name(DangerCategory category) -> std::string {
    switch (category) {
    case DangerCategory::PROCESS_EXECUTION:
        return "process execution";
    case DangerCategory::DYNAMIC_EVALUATION:
        return "dynamic evaluation";
    case DangerCategory::FILESYSTEM_DESTRUCTION:
        return "filesystem destruction";
    case DangerCategory::PROCESS_TERMINATION:
        return "process termination";
    case DangerCategory::NETWORK_ACCESS:
        return "network access";
    case DangerCategory::UNSAFE_DESERIALIZATION:
        return "unsafe deserialization";
    }
    return "unknown";
}

} // namespace pyspot
