// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace haul::core {

constexpr std::uint32_t DEFAULT_CONCURRENCY = 2;
constexpr std::uint32_t MAX_CONCURRENCY = 16;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t READ_TIMEOUT_SEC = 30;                       // below 1 B/s for this long
constexpr std::uint32_t RETRY_COUNT = 3;
constexpr std::uint32_t MAX_RETRY_COUNT = 100;

constexpr std::chrono::milliseconds BACKOFF_INITIAL{500};
constexpr std::chrono::milliseconds BACKOFF_MAX{8000};
constexpr std::chrono::milliseconds PROGRESS_INTERVAL{250};
constexpr std::chrono::milliseconds LEDGER_SAVE_INTERVAL{1000};
constexpr std::chrono::milliseconds RATE_WINDOW{100};

constexpr std::size_t RECEIVE_BUFFER_SIZE = 64 * 1024;               // 64 KB, keeps cancel latency low
constexpr std::size_t EVENT_QUEUE_CAPACITY = 1024;

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::string_view DEFAULT_USER_AGENT =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 haul/0.1";

// Runtime engine configuration, optionally loaded from a JSON file
struct EngineConfig {
    std::uint32_t concurrency{DEFAULT_CONCURRENCY};
    std::uint32_t retry_limit{RETRY_COUNT};
    std::chrono::milliseconds backoff_initial{BACKOFF_INITIAL};
    std::chrono::milliseconds backoff_max{BACKOFF_MAX};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t read_timeout_sec{READ_TIMEOUT_SEC};
    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};
    std::chrono::milliseconds ledger_interval{LEDGER_SAVE_INTERVAL};
    std::size_t buffer_size{RECEIVE_BUFFER_SIZE};
    std::string user_agent{DEFAULT_USER_AGENT};
    bool verify_tls{true};
    std::optional<std::string> proxy;   // unset: libcurl's environment; empty: direct
    bool delete_partial_on_cancel{false};
    std::string log_level{"info"};

    // Check ranges; returns invalid_config on the first bad field
    [[nodiscard]] std::error_code validate() const noexcept;

    // Backoff before retry number `attempt` (1-based)
    [[nodiscard]] std::chrono::milliseconds backoff(std::uint32_t attempt) const noexcept;

    [[nodiscard]] static std::expected<EngineConfig, std::error_code>
    load(std::string_view path) noexcept;

    [[nodiscard]] static std::expected<EngineConfig, std::error_code>
    parse(std::string_view json_text) noexcept;
};

} // namespace haul::core
