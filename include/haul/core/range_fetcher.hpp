// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/error.hpp>
#include <haul/core/stop_signal.hpp>
#include <haul/disk/file_writer.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace haul::core {

enum class FetchStatus : std::uint8_t {
    completed,
    cancelled,
    failed
};

// Result of one ranged GET
struct FetchOutcome {
    FetchStatus status{FetchStatus::failed};
    std::uint64_t bytes_written{0};   // written to the sink by this call
    std::error_code error;
    std::string reason;               // human-readable detail for failures

    [[nodiscard]] static FetchOutcome completed(std::uint64_t bytes) {
        return {FetchStatus::completed, bytes, {}, {}};
    }
    [[nodiscard]] static FetchOutcome cancelled(std::uint64_t bytes) {
        return {FetchStatus::cancelled, bytes, make_error_code(TransferErrc::cancelled), {}};
    }
    [[nodiscard]] static FetchOutcome failed(std::uint64_t bytes, std::error_code ec, std::string why = {}) {
        if (why.empty()) why = ec.message();
        return {FetchStatus::failed, bytes, ec, std::move(why)};
    }
};

// What a lightweight probe learned about a resource
struct ProbeInfo {
    std::int32_t status_code{0};
    std::optional<std::uint64_t> total_size;
    bool accepts_ranges{false};
    std::string content_type;
    std::string filename;     // From Content-Disposition
};

// Called after each block has been written to the sink
using ChunkCallback = std::function<void(std::uint64_t bytes)>;

// One HTTP GET against a byte range of a single resource. No internal retries;
// the caller owns retry policy.
class RangeFetcher {
public:
    virtual ~RangeFetcher() = default;

    [[nodiscard]] virtual std::expected<ProbeInfo, std::error_code>
    probe(const std::string& url, const StopSignal& stop) noexcept = 0;

    // Request bytes from `start_offset` to the end and stream them into `sink`.
    // If the server does not honor the range, fails with range_ignored without
    // writing anything.
    [[nodiscard]] virtual FetchOutcome
    fetch(const std::string& url,
          std::uint64_t start_offset,
          disk::ByteSink& sink,
          const StopSignal& stop,
          const ChunkCallback& on_chunk) noexcept = 0;
};

} // namespace haul::core
