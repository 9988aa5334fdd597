// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace haul::core {

// Persisted progress for one destination file
struct ResumeRecord {
    std::string destination_path;
    std::string source_url;
    std::uint64_t bytes_written{0};
    std::optional<std::uint64_t> expected_size;
    std::int64_t verified_at{0};   // unix seconds of the last save
};

// JSON sidecar store, one record per destination (<destination>.haulmeta).
// Bytes on disk are ground truth; the record only narrows them.
class ResumeLedger {
public:
    // Sidecar path for a destination file
    [[nodiscard]] static std::string record_path(std::string_view destination);

    // Missing or unparseable records both yield nullopt; the latter is logged
    [[nodiscard]] static std::optional<ResumeRecord> load(std::string_view destination) noexcept;

    // Write <record>.tmp then rename over the record. Stamps verified_at.
    [[nodiscard]] static std::error_code save(const ResumeRecord& record) noexcept;

    // Remove the record; a missing record is not an error
    [[nodiscard]] static std::error_code remove(std::string_view destination) noexcept;

    // Offset a fetch may safely continue from: 0 without a file, else
    // min(file size, recorded bytes). A record ahead of the file is rewritten.
    [[nodiscard]] static std::expected<std::uint64_t, std::error_code>
    reconcile(std::string_view destination) noexcept;
};

} // namespace haul::core
