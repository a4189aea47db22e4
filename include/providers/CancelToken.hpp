#pragma once

#include <atomic>
#include <memory>

namespace later {

// Shared flag checked by in-flight provider transfers.
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

inline CancelTokenPtr makeCancelToken() {
    return std::make_shared<CancelToken>();
}

} // namespace later
