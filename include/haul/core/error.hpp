// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace haul::core {

enum class TransferErrc {
    success = 0,
    network_error,
    timeout,
    connection_lost,
    dns_error,
    ssl_error,
    refused,
    too_many_redirects,
    range_ignored,
    range_not_satisfiable,
    not_found,
    unauthorized,
    client_error,
    server_error,
    size_mismatch,
    probe_failed,
    invalid_url,
    invalid_path,
    invalid_config,
    invalid_state,
    duplicate_destination,
    cancelled,
    retries_exhausted,
};

namespace detail {

struct TransferErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "haul::transfer";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<TransferErrc>(ev)) {
            case TransferErrc::success:               return "Success";
            case TransferErrc::network_error:         return "Network error";
            case TransferErrc::timeout:               return "Operation timed out";
            case TransferErrc::connection_lost:       return "Connection lost";
            case TransferErrc::dns_error:             return "DNS resolution failed";
            case TransferErrc::ssl_error:             return "SSL/TLS error";
            case TransferErrc::refused:               return "Connection refused";
            case TransferErrc::too_many_redirects:    return "Too many redirects";
            case TransferErrc::range_ignored:         return "Server ignored the range request";
            case TransferErrc::range_not_satisfiable: return "Requested range not satisfiable (416)";
            case TransferErrc::not_found:             return "Resource not found (404)";
            case TransferErrc::unauthorized:          return "Not authorized (401/403)";
            case TransferErrc::client_error:          return "Request rejected by server (4xx)";
            case TransferErrc::server_error:          return "Server error (5xx)";
            case TransferErrc::size_mismatch:         return "Received more bytes than expected";
            case TransferErrc::probe_failed:          return "Probe failed";
            case TransferErrc::invalid_url:           return "Invalid URL";
            case TransferErrc::invalid_path:          return "Invalid destination path";
            case TransferErrc::invalid_config:        return "Invalid configuration";
            case TransferErrc::invalid_state:         return "Operation not allowed in current state";
            case TransferErrc::duplicate_destination: return "Destination path already in use";
            case TransferErrc::cancelled:             return "Transfer cancelled";
            case TransferErrc::retries_exhausted:     return "Retries exhausted";
            default:                                  return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::TransferErrcCategory& transfer_errc_category() noexcept {
    static detail::TransferErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TransferErrc e) noexcept {
    return {static_cast<int>(e), transfer_errc_category()};
}

// Coarse taxonomy the transfer task uses to pick retry vs terminal failure
enum class ErrorKind : std::uint8_t {
    none,
    transient_network,      // timeout, reset, 5xx - retried with backoff
    server_rejected_range,  // restart from offset 0 on a fresh file
    non_recoverable_server, // 4xx other than range-related
    local_io,               // disk full, permission denied
    cancellation,           // not a failure
    corrupt_resume_state,   // record ahead of the file, auto-corrected
};

[[nodiscard]] ErrorKind classify(const std::error_code& ec) noexcept;

[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;

// Map an HTTP status to an error (empty for 2xx)
[[nodiscard]] std::error_code error_from_http_status(long status) noexcept;

} // namespace haul::core

namespace std {

template<>
struct is_error_code_enum<haul::core::TransferErrc> : true_type {};

} // namespace std
