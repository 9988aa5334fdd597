// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/error.hpp>
#include <haul/disk/error.hpp>

namespace haul::core {

ErrorKind classify(const std::error_code& ec) noexcept {
    if (!ec) return ErrorKind::none;

    if (ec.category() == disk::disk_errc_category()) {
        if (ec == disk::DiskErrc::corrupt_record) {
            return ErrorKind::corrupt_resume_state;
        }
        return ErrorKind::local_io;
    }

    if (ec.category() != transfer_errc_category()) {
        // Raw errno / system errors only come from the filesystem layer
        return ErrorKind::local_io;
    }

    switch (static_cast<TransferErrc>(ec.value())) {
        case TransferErrc::network_error:
        case TransferErrc::timeout:
        case TransferErrc::connection_lost:
        case TransferErrc::dns_error:
        case TransferErrc::refused:
        case TransferErrc::server_error:
            return ErrorKind::transient_network;

        case TransferErrc::range_ignored:
        case TransferErrc::range_not_satisfiable:
            return ErrorKind::server_rejected_range;

        case TransferErrc::cancelled:
            return ErrorKind::cancellation;

        case TransferErrc::invalid_path:
            return ErrorKind::local_io;

        default:
            return ErrorKind::non_recoverable_server;
    }
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::none:                   return "none";
        case ErrorKind::transient_network:      return "transient network error";
        case ErrorKind::server_rejected_range:  return "server rejected range";
        case ErrorKind::non_recoverable_server: return "non-recoverable server error";
        case ErrorKind::local_io:               return "local I/O error";
        case ErrorKind::cancellation:           return "cancellation requested";
        case ErrorKind::corrupt_resume_state:   return "corrupt resume state";
    }
    return "unknown";
}

std::error_code error_from_http_status(long status) noexcept {
    if (status >= 200 && status < 300) return {};
    if (status == 416) return make_error_code(TransferErrc::range_not_satisfiable);
    if (status == 404 || status == 410) return make_error_code(TransferErrc::not_found);
    if (status == 401 || status == 403) return make_error_code(TransferErrc::unauthorized);
    if (status == 408 || status == 429) return make_error_code(TransferErrc::server_error);
    if (status >= 500) return make_error_code(TransferErrc::server_error);
    return make_error_code(TransferErrc::client_error);
}

} // namespace haul::core
