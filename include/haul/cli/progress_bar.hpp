// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace haul::cli {

// Single-line status for the whole batch. Without a known total only bytes
// and speed are shown.
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    void update(std::uint64_t current,
                std::optional<std::uint64_t> total,
                std::uint64_t speed_bps = 0,
                std::optional<std::uint64_t> eta_seconds = std::nullopt) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) noexcept { label_ = l; }

    [[nodiscard]] std::string render(std::uint64_t current,
                                     std::optional<std::uint64_t> total,
                                     std::uint64_t speed_bps,
                                     std::optional<std::uint64_t> eta_seconds) const;

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::string label_;
    std::size_t last_width_{0};
    bool drawn_{false};
};

[[nodiscard]] std::string format_bytes(std::uint64_t bytes);
[[nodiscard]] std::string format_speed(std::uint64_t bps);
[[nodiscard]] std::string format_time(std::uint64_t seconds);

} // namespace haul::cli
