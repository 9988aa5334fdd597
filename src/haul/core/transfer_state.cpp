// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/transfer_state.hpp>

namespace haul::core {

const char* to_string(TransferState state) noexcept {
    switch (state) {
        case TransferState::pending:     return "pending";
        case TransferState::probing:     return "probing";
        case TransferState::downloading: return "downloading";
        case TransferState::paused:      return "paused";
        case TransferState::cancelled:   return "cancelled";
        case TransferState::completed:   return "completed";
        case TransferState::failed:      return "failed";
    }
    return "unknown";
}

bool is_terminal(TransferState state) noexcept {
    return state == TransferState::cancelled ||
           state == TransferState::completed ||
           state == TransferState::failed;
}

bool can_transition(TransferState from, TransferState to) noexcept {
    using S = TransferState;
    switch (from) {
        case S::pending:
            return to == S::probing || to == S::cancelled;
        case S::probing:
            return to == S::downloading || to == S::completed || to == S::paused ||
                   to == S::cancelled || to == S::failed;
        case S::downloading:
            return to == S::paused || to == S::cancelled || to == S::completed ||
                   to == S::failed;
        case S::paused:
            return to == S::downloading || to == S::probing || to == S::cancelled;
        case S::cancelled:
        case S::completed:
        case S::failed:
            // Restart via start() only
            return to == S::probing;
    }
    return false;
}

} // namespace haul::core
