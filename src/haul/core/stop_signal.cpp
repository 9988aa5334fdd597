// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/stop_signal.hpp>

namespace haul::core {

void StopSignal::request(StopReason reason) noexcept {
    if (reason == StopReason::none) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto current = reason_.load(std::memory_order_relaxed);
        if (current != StopReason::cancel) {
            reason_.store(reason, std::memory_order_release);
        }
    }
    cv_.notify_all();
}

void StopSignal::reset() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    reason_.store(StopReason::none, std::memory_order_release);
}

bool StopSignal::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] {
        return reason_.load(std::memory_order_acquire) != StopReason::none;
    });
}

} // namespace haul::core
