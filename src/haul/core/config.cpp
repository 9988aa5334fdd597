// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/config.hpp>
#include <haul/core/error.hpp>
#include <haul/core/log.hpp>
#include <haul/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace haul::core {

std::error_code EngineConfig::validate() const noexcept {
    if (concurrency == 0 || concurrency > MAX_CONCURRENCY) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (retry_limit > MAX_RETRY_COUNT) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (backoff_initial.count() < 0 || backoff_max < backoff_initial) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (connect_timeout_sec == 0 || read_timeout_sec == 0) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (progress_interval.count() <= 0 || ledger_interval.count() <= 0) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (buffer_size < 1024) {
        return make_error_code(TransferErrc::invalid_config);
    }
    return {};
}

std::chrono::milliseconds EngineConfig::backoff(std::uint32_t attempt) const noexcept {
    if (attempt == 0) return std::chrono::milliseconds{0};

    auto delay = backoff_initial;
    for (std::uint32_t i = 1; i < attempt && delay < backoff_max; ++i) {
        delay *= 2;
    }
    return std::min(delay, backoff_max);
}

std::expected<EngineConfig, std::error_code>
EngineConfig::parse(std::string_view json_text) noexcept {
    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(TransferErrc::invalid_config));
        }

        EngineConfig cfg;
        cfg.concurrency = j.value("concurrency", cfg.concurrency);
        cfg.retry_limit = j.value("retry_limit", cfg.retry_limit);
        cfg.backoff_initial = std::chrono::milliseconds{
            j.value("backoff_initial_ms", cfg.backoff_initial.count())};
        cfg.backoff_max = std::chrono::milliseconds{
            j.value("backoff_max_ms", cfg.backoff_max.count())};
        cfg.connect_timeout_sec = j.value("connect_timeout_sec", cfg.connect_timeout_sec);
        cfg.read_timeout_sec = j.value("read_timeout_sec", cfg.read_timeout_sec);
        cfg.progress_interval = std::chrono::milliseconds{
            j.value("progress_interval_ms", cfg.progress_interval.count())};
        cfg.ledger_interval = std::chrono::milliseconds{
            j.value("ledger_interval_ms", cfg.ledger_interval.count())};
        cfg.buffer_size = j.value("buffer_size", cfg.buffer_size);
        cfg.user_agent = j.value("user_agent", cfg.user_agent);
        cfg.verify_tls = j.value("verify_tls", cfg.verify_tls);
        if (auto it = j.find("proxy"); it != j.end() && !it->is_null()) {
            cfg.proxy = it->get<std::string>();
        }
        cfg.delete_partial_on_cancel = j.value("delete_partial_on_cancel", cfg.delete_partial_on_cancel);
        cfg.log_level = j.value("log_level", cfg.log_level);

        if (auto ec = cfg.validate()) {
            return std::unexpected(ec);
        }
        return cfg;
    } catch (const nlohmann::json::exception& e) {
        logger()->error("config: {}", e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    }
}

std::expected<EngineConfig, std::error_code>
EngineConfig::load(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path), std::ios::binary};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        return parse(ss.str());
    } catch (const std::exception& e) {
        logger()->error("config: cannot read {}: {}", path, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace haul::core
