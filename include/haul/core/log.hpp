// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace haul::core {

// Shared "haul" logger (stderr). Created on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names: trace, debug, info, warn, error, critical, off
void set_log_level(std::string_view level) noexcept;

} // namespace haul::core
