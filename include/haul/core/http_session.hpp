// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/config.hpp>
#include <haul/core/error.hpp>
#include <haul/core/range_fetcher.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace haul::core {

// Response headers of the final hop (after redirects)
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;   // lower-case names
    std::optional<std::uint64_t> content_length;
    bool accepts_ranges{false};
    std::string content_type;
    std::string filename;
};

// Parsed "Content-Range: bytes first-last/total"
struct ContentRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
    std::optional<std::uint64_t> total;   // "*" when unknown
};

// libcurl-backed range fetcher
class HttpSession final : public RangeFetcher {
public:
    explicit HttpSession(EngineConfig config = {});
    ~HttpSession() override = default;

    // Non-copyable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    // HEAD request, following redirects
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url, const StopSignal& stop) noexcept;

    [[nodiscard]] std::expected<ProbeInfo, std::error_code>
    probe(const std::string& url, const StopSignal& stop) noexcept override;

    [[nodiscard]] FetchOutcome
    fetch(const std::string& url,
          std::uint64_t start_offset,
          disk::ByteSink& sink,
          const StopSignal& stop,
          const ChunkCallback& on_chunk) noexcept override;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

    [[nodiscard]] static std::optional<ContentRange> parse_content_range(std::string_view value) noexcept;
    [[nodiscard]] static std::string parse_content_disposition(std::string_view content_disposition);

private:
    EngineConfig config_;
};

} // namespace haul::core
