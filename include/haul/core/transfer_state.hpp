// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>

namespace haul::core {

// Lifecycle of one transfer task
enum class TransferState : std::uint8_t {
    pending,     // Created, not yet run
    probing,     // HEAD request, resume offset
    downloading, // Streaming bytes to disk
    paused,      // Stopped by caller, bytes kept
    cancelled,   // Stopped for good by caller
    completed,   // All bytes on disk, record removed
    failed       // Gave up; reason is set
};

[[nodiscard]] const char* to_string(TransferState state) noexcept;

[[nodiscard]] bool is_terminal(TransferState state) noexcept;

// Legal-transition table
[[nodiscard]] bool can_transition(TransferState from, TransferState to) noexcept;

} // namespace haul::core
