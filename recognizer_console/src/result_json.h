#pragma once

#include <string>

namespace recognizer_console {

// Summary of the service's detailed JSON result.
struct JsonResultSummary {
    bool parsed = false;
    std::string display_text;
    double confidence = -1.0;   // -1 when the result carries no NBest list
};

// Never throws; malformed or empty JSON yields parsed == false.
JsonResultSummary SummarizeJsonResult(const std::string& json);

std::string FormatJsonResultSummary(const JsonResultSummary& summary);

} // namespace recognizer_console
