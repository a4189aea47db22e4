#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace later {

struct SummaryOutput {
    std::string summary;
    double expiryScore = 0.0;   // clamped to [0, 1]
};

// JSON schemas sent to the completion provider, and validated decoders for what
// comes back. Decoders throw ValidationError on missing or mistyped fields.
class StructuredOutput {
public:
    static nlohmann::json summarySchema();
    static nlohmann::json labelSchema();

    static SummaryOutput parseSummary(const nlohmann::json& output);
    static std::string parseLabel(const nlohmann::json& output);

    static constexpr size_t kMaxLabelLength = 64;
};

} // namespace later
