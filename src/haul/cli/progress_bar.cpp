// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/cli/progress_bar.hpp>
#include <haul/core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace haul::cli {

namespace {

constexpr std::uint64_t KB = 1024;
constexpr std::uint64_t MB = 1024 * KB;
constexpr std::uint64_t GB = 1024 * MB;
constexpr std::uint64_t TB = 1024 * GB;

constexpr int BAR_WIDTH = 30;

} // namespace

ProgressBar::ProgressBar(std::string_view label)
    : label_(label) {}

void ProgressBar::update(std::uint64_t current,
                         std::optional<std::uint64_t> total,
                         std::uint64_t speed_bps,
                         std::optional<std::uint64_t> eta_seconds) noexcept {
    try {
        auto line = render(current, total, speed_bps, eta_seconds);

        // Pad over leftovers of a longer previous line
        auto width = line.size();
        if (width < last_width_) {
            line.append(last_width_ - width, ' ');
        }
        last_width_ = width;
        drawn_ = true;

        std::cout << '\r' << line << std::flush;
    } catch (const std::exception& e) {
        core::logger()->debug("progress bar: {}", e.what());
    }
}

void ProgressBar::finish() noexcept {
    if (!drawn_) return;
    drawn_ = false;
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    if (!drawn_) return;
    drawn_ = false;
    std::cout << '\r' << std::string(last_width_, ' ') << '\r' << std::flush;
}

std::string ProgressBar::render(std::uint64_t current,
                                std::optional<std::uint64_t> total,
                                std::uint64_t speed_bps,
                                std::optional<std::uint64_t> eta_seconds) const {
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (total && *total > 0) {
        double percent = static_cast<double>(current) * 100.0 / static_cast<double>(*total);
        percent = std::clamp(percent, 0.0, 100.0);
        line += fmt::format("{} {:3d}% ({}/{})", render_bar(percent), static_cast<int>(percent),
                            format_bytes(current), format_bytes(*total));
    } else {
        line += format_bytes(current);
    }

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);
    }
    if (eta_seconds && *eta_seconds > 0) {
        line += " ETA: ";
        line += format_time(*eta_seconds);
    }
    return line;
}

std::string ProgressBar::render_bar(double percent) {
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));
    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < BAR_WIDTH) {
        bar += '>';
        bar.append(static_cast<std::size_t>(BAR_WIDTH - filled - 1), ' ');
    }
    bar += ']';
    return bar;
}

std::string format_speed(std::uint64_t bps) {
    if (bps >= GB) return fmt::format("{:.1f} GB/s", static_cast<double>(bps) / GB);
    if (bps >= MB) return fmt::format("{:.1f} MB/s", static_cast<double>(bps) / MB);
    if (bps >= KB) return fmt::format("{:.1f} KB/s", static_cast<double>(bps) / KB);
    return fmt::format("{} B/s", bps);
}

std::string format_bytes(std::uint64_t bytes) {
    if (bytes >= TB) return fmt::format("{:.2f} TB", static_cast<double>(bytes) / TB);
    if (bytes >= GB) return fmt::format("{:.2f} GB", static_cast<double>(bytes) / GB);
    if (bytes >= MB) return fmt::format("{:.1f} MB", static_cast<double>(bytes) / MB);
    if (bytes >= KB) return fmt::format("{:.0f} KB", static_cast<double>(bytes) / KB);
    return fmt::format("{} B", bytes);
}

std::string format_time(std::uint64_t seconds) {
    auto hours = seconds / 3600;
    auto minutes = (seconds % 3600) / 60;
    auto secs = seconds % 60;

    if (hours > 0) return fmt::format("{}h {:02d}m {}s", hours, minutes, secs);
    if (minutes > 0) return fmt::format("{}m {}s", minutes, secs);
    return fmt::format("{}s", secs);
}

} // namespace haul::cli
