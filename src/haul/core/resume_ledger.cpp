// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/resume_ledger.hpp>
#include <haul/core/log.hpp>
#include <haul/disk/error.hpp>
#include <haul/disk/file_writer.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace haul::core {

namespace {

constexpr int RECORD_VERSION = 1;

nlohmann::json to_json(const ResumeRecord& record, std::int64_t stamp) {
    nlohmann::json j;
    j["version"] = RECORD_VERSION;
    j["destination"] = record.destination_path;
    j["url"] = record.source_url;
    j["bytes_written"] = record.bytes_written;
    if (record.expected_size) {
        j["expected_size"] = *record.expected_size;
    } else {
        j["expected_size"] = nullptr;
    }
    j["verified_at"] = stamp;
    return j;
}

std::expected<ResumeRecord, std::error_code> from_json(const nlohmann::json& j) {
    if (!j.is_object() || j.value("version", 0) != RECORD_VERSION) {
        return std::unexpected(make_error_code(disk::DiskErrc::corrupt_record));
    }

    ResumeRecord record;
    record.destination_path = j.at("destination").get<std::string>();
    record.source_url = j.at("url").get<std::string>();
    record.bytes_written = j.at("bytes_written").get<std::uint64_t>();
    const auto& size = j.at("expected_size");
    if (!size.is_null()) {
        record.expected_size = size.get<std::uint64_t>();
    }
    record.verified_at = j.value("verified_at", std::int64_t{0});
    return record;
}

std::int64_t unix_now() noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

std::string ResumeLedger::record_path(std::string_view destination) {
    return std::string(destination) + ".haulmeta";
}

std::optional<ResumeRecord> ResumeLedger::load(std::string_view destination) noexcept {
    try {
        auto path = record_path(destination);
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        auto parsed = nlohmann::json::parse(buffer.str(), nullptr, false);
        if (parsed.is_discarded()) {
            logger()->warn("ignoring corrupt resume record {}", path);
            return std::nullopt;
        }

        auto record = from_json(parsed);
        if (!record) {
            logger()->warn("ignoring resume record {}: {}", path, record.error().message());
            return std::nullopt;
        }
        return *record;
    } catch (const nlohmann::json::exception& e) {
        logger()->warn("ignoring corrupt resume record for {}: {}", destination, e.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        logger()->error("reading resume record for {}: {}", destination, e.what());
        return std::nullopt;
    }
}

std::error_code ResumeLedger::save(const ResumeRecord& record) noexcept {
    try {
        auto path = record_path(record.destination_path);
        auto tmp = path + ".tmp";

        // Create parent directories if they don't exist
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
            if (ec) return disk::error_from_errno(ec.value());
        }

        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
            file << to_json(record, unix_now()).dump();
            file.flush();
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            logger()->error("renaming {} failed: {}", tmp, ec.message());
            return disk::error_from_errno(ec.value());
        }
        return {};
    } catch (const std::exception& e) {
        logger()->error("saving resume record for {}: {}", record.destination_path, e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::error_code ResumeLedger::remove(std::string_view destination) noexcept {
    try {
        return disk::remove_file(record_path(destination));
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::expected<std::uint64_t, std::error_code>
ResumeLedger::reconcile(std::string_view destination) noexcept {
    auto actual = disk::file_size(destination);
    if (!actual) {
        if (actual.error() != make_error_code(disk::DiskErrc::file_not_found)) {
            return std::unexpected(actual.error());
        }
        // No bytes on disk: a leftover record describes nothing
        if (auto ec = remove(destination)) {
            return std::unexpected(ec);
        }
        return 0;
    }

    auto record = load(destination);
    if (!record) {
        return *actual;
    }

    if (record->bytes_written > *actual) {
        logger()->warn("resume record for {} claims {} bytes, file holds {}; correcting",
                       destination, record->bytes_written, *actual);
        record->bytes_written = *actual;
        if (auto ec = save(*record)) {
            return std::unexpected(ec);
        }
        return *actual;
    }

    return record->bytes_written;
}

} // namespace haul::core
