#include "pipeline/RetryPolicy.hpp"
#include <algorithm>
#include <cmath>
#include <thread>

namespace later {

RetryPolicy::RetryPolicy(const RetryConfig& config, Sleeper sleeper)
    : config_(config), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

std::chrono::milliseconds RetryPolicy::delayFor(int attempt) const {
    double delay = static_cast<double>(config_.initialDelayMs) *
                   std::pow(config_.multiplier, std::max(0, attempt - 1));
    delay = std::min(delay, static_cast<double>(config_.maxDelayMs));
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

} // namespace later
