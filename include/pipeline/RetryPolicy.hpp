#pragma once

#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "providers/CancelToken.hpp"
#include <chrono>
#include <functional>
#include <iostream>
#include <string>

namespace later {

// Bounded exponential backoff for transient provider failures. Anything that is
// not a transient ProviderError is rethrown on the spot.
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit RetryPolicy(const RetryConfig& config = {}, Sleeper sleeper = nullptr);

    // Delay after the given failed attempt (1-based)
    std::chrono::milliseconds delayFor(int attempt) const;

    int maxAttempts() const { return config_.maxAttempts; }

    template <typename Fn>
    auto run(const std::string& what, Fn&& fn, const CancelToken* cancel = nullptr) -> decltype(fn()) {
        for (int attempt = 1;; ++attempt) {
            try {
                return fn();
            } catch (const ProviderError& e) {
                bool cancelled = cancel && cancel->cancelled();
                if (!e.transient() || attempt >= config_.maxAttempts || cancelled) {
                    throw;
                }
                auto delay = delayFor(attempt);
                std::cerr << "[retry] " << what << " attempt " << attempt << "/"
                          << config_.maxAttempts << " failed: " << e.what()
                          << "; retrying in " << delay.count() << "ms" << std::endl;
                sleeper_(delay);
                if (cancel && cancel->cancelled()) {
                    throw;
                }
            }
        }
    }

private:
    RetryConfig config_;
    Sleeper sleeper_;
};

} // namespace later
