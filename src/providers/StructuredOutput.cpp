#include "providers/StructuredOutput.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cmath>

namespace later {

namespace {
    std::string trim(const std::string& s, const char* strip = " \t\r\n") {
        size_t start = s.find_first_not_of(strip);
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(strip);
        return s.substr(start, end - start + 1);
    }

    // Labels sometimes come back quoted or with a full stop.
    const char* kLabelStrip = " \t\r\n\"'.";

    const nlohmann::json& requireField(const nlohmann::json& output, const char* name) {
        if (!output.is_object()) {
            throw ValidationError("Structured output is not an object");
        }
        auto it = output.find(name);
        if (it == output.end() || it->is_null()) {
            throw ValidationError(std::string("Structured output is missing '") + name + "'");
        }
        return *it;
    }
}

nlohmann::json StructuredOutput::summarySchema() {
    return {
        {"title", "SummaryData"},
        {"type", "object"},
        {"properties", {
            {"summary", {{"type", "string"}, {"description", "1-2 sentence summary"}}},
            {"expiry_score", {{"type", "number"},
                              {"description", "0 = evergreen, 1 = decays fastest"}}}
        }},
        {"required", {"summary", "expiry_score"}},
        {"additionalProperties", false}
    };
}

nlohmann::json StructuredOutput::labelSchema() {
    return {
        {"title", "ClusterLabel"},
        {"type", "object"},
        {"properties", {
            {"label", {{"type", "string"}, {"description", "1-3 word theme"}}}
        }},
        {"required", {"label"}},
        {"additionalProperties", false}
    };
}

SummaryOutput StructuredOutput::parseSummary(const nlohmann::json& output) {
    const auto& summary = requireField(output, "summary");
    const auto& score = requireField(output, "expiry_score");

    if (!summary.is_string()) {
        throw ValidationError("'summary' must be a string");
    }
    if (!score.is_number()) {
        throw ValidationError("'expiry_score' must be a number");
    }

    SummaryOutput result;
    result.summary = trim(summary.get<std::string>());
    if (result.summary.empty()) {
        throw ValidationError("'summary' is empty");
    }
    double value = score.get<double>();
    if (!std::isfinite(value)) {
        throw ValidationError("'expiry_score' is not a finite number");
    }
    result.expiryScore = std::max(0.0, std::min(1.0, value));
    return result;
}

std::string StructuredOutput::parseLabel(const nlohmann::json& output) {
    const auto& label = requireField(output, "label");
    if (!label.is_string()) {
        throw ValidationError("'label' must be a string");
    }
    std::string text = trim(label.get<std::string>(), kLabelStrip);
    if (text.empty()) {
        throw ValidationError("'label' is empty");
    }
    if (text.size() > kMaxLabelLength) {
        text = trim(text.substr(0, kMaxLabelLength), kLabelStrip);
    }
    return text;
}

} // namespace later
