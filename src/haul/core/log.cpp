// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace haul::core {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("haul");
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt("haul");
        created->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

void set_log_level(std::string_view level) noexcept {
    try {
        auto lvl = spdlog::level::from_str(std::string(level));
        // from_str maps unknown names to "off"
        if (lvl == spdlog::level::off && level != "off") {
            lvl = spdlog::level::info;
        }
        logger()->set_level(lvl);
    } catch (const std::exception& e) {
        spdlog::error("haul: cannot set log level: {}", e.what());
    }
}

} // namespace haul::core
