#pragma once

#include <cmath>
#include <optional>
#include <nlohmann/json.hpp>

namespace later {

// JSON has no NaN or infinity; those become null.
inline nlohmann::json finiteOrNull(double value) {
    if (!std::isfinite(value)) return nullptr;
    return value;
}

inline nlohmann::json finiteOrNull(const std::optional<double>& value) {
    if (!value) return nullptr;
    return finiteOrNull(*value);
}

} // namespace later
