#include "result_json.h"

#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace recognizer_console {

namespace {

std::string StringField(const json& object, const char* key) {
    auto it = object.find(key);
    return it != object.end() && it->is_string() ? it->get<std::string>() : std::string();
}

} // namespace

JsonResultSummary SummarizeJsonResult(const std::string& text) {
    JsonResultSummary summary;
    if (text.empty()) {
        return summary;
    }
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return summary;
    }
    summary.parsed = true;
    summary.display_text = StringField(parsed, "DisplayText");

    auto nbest = parsed.find("NBest");
    if (nbest != parsed.end() && nbest->is_array() && !nbest->empty()) {
        const json& best = nbest->front();
        if (best.is_object()) {
            auto confidence = best.find("Confidence");
            if (confidence != best.end() && confidence->is_number()) {
                summary.confidence = confidence->get<double>();
            }
            if (summary.display_text.empty()) {
                summary.display_text = StringField(best, "Display");
            }
        }
    }
    return summary;
}

std::string FormatJsonResultSummary(const JsonResultSummary& summary) {
    if (!summary.parsed) {
        return "(no detailed result)";
    }
    std::ostringstream ss;
    ss << "DisplayText:<" << summary.display_text << ">";
    if (summary.confidence >= 0.0) {
        ss << " Confidence:" << std::fixed << std::setprecision(2) << summary.confidence;
    }
    return ss.str();
}

} // namespace recognizer_console
