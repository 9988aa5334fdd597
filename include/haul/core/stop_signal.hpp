// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace haul::core {

enum class StopReason : std::uint8_t {
    none,
    pause,
    cancel
};

// Cooperative stop request shared by a transfer task and everything it calls.
// Cancel overrides pause; a pending cancel is never downgraded.
class StopSignal {
public:
    StopSignal() = default;

    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    void request(StopReason reason) noexcept;

    // Clear before a new run
    void reset() noexcept;

    [[nodiscard]] StopReason reason() const noexcept { return reason_.load(std::memory_order_acquire); }
    [[nodiscard]] bool stop_requested() const noexcept { return reason() != StopReason::none; }

    // Sleep for `duration` unless a stop arrives first. Returns true if stopped.
    [[nodiscard]] bool wait_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<StopReason> reason_{StopReason::none};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace haul::core
