// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <optional>

namespace haul::core {

// Derived telemetry for one task; never persisted
struct TransferProgress {
    std::uint64_t bytes_done{0};
    std::optional<std::uint64_t> bytes_total;
    std::uint64_t rate_bps{0};
    std::optional<std::uint64_t> eta_seconds;
    std::chrono::steady_clock::time_point last_update;

    [[nodiscard]] double percent() const noexcept {
        if (!bytes_total || *bytes_total == 0) return 0.0;
        return 100.0 * static_cast<double>(bytes_done) / static_cast<double>(*bytes_total);
    }
};

// Instantaneous transfer rate. Bytes accumulate until at least one window has
// elapsed, then the rate is recomputed from that sample.
class RateMeter {
public:
    using clock = std::chrono::steady_clock;

    explicit RateMeter(std::chrono::milliseconds window = RATE_WINDOW) noexcept
        : window_(window) {}

    void reset(clock::time_point now = clock::now()) noexcept {
        window_start_ = now;
        window_bytes_ = 0;
        rate_bps_ = 0;
    }

    void add(std::uint64_t bytes, clock::time_point now = clock::now()) noexcept {
        window_bytes_ += bytes;
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - window_start_);
        if (elapsed >= window_) {
            rate_bps_ = window_bytes_ * 1000 / static_cast<std::uint64_t>(elapsed.count());
            window_bytes_ = 0;
            window_start_ = now;
        }
    }

    [[nodiscard]] std::uint64_t rate_bps() const noexcept { return rate_bps_; }

private:
    std::chrono::milliseconds window_;
    clock::time_point window_start_{clock::now()};
    std::uint64_t window_bytes_{0};
    std::uint64_t rate_bps_{0};
};

// Seconds left at the given rate; unknown without a total or a rate
[[nodiscard]] inline std::optional<std::uint64_t>
estimate_eta(std::uint64_t done, std::optional<std::uint64_t> total, std::uint64_t rate_bps) noexcept {
    if (!total || rate_bps == 0) return std::nullopt;
    if (done >= *total) return 0;
    return (*total - done) / rate_bps;
}

} // namespace haul::core
