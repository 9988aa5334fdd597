// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace haul::disk {

// Destination byte consumer for a fetch. Writes are strictly sequential.
class ByteSink {
public:
    virtual ~ByteSink() = default;

    [[nodiscard]] virtual std::error_code write(const void* data, std::size_t size) noexcept = 0;

    // Bytes accepted so far, including the offset the sink was opened at
    [[nodiscard]] virtual std::uint64_t position() const noexcept = 0;
};

// Append-only destination file. open() truncates the file to the resume offset
// so that writes continue exactly where the previous run stopped.
class FileWriter final : public ByteSink {
public:
    FileWriter() = default;
    ~FileWriter() override;

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Open (creating parent directories) and cut the file to `offset` bytes.
    // Fails with invalid_path if the file is shorter than `offset`.
    [[nodiscard]] std::error_code open(std::string_view path, std::uint64_t offset) noexcept;

    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept override;

    // fsync to stable storage
    [[nodiscard]] std::error_code flush() noexcept;

    // Flush and close; safe to call twice
    [[nodiscard]] std::error_code close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] std::uint64_t position() const noexcept override { return position_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    int fd_{-1};
    std::uint64_t position_{0};
    std::string path_;
};

// Size of a regular file, or file_not_found
[[nodiscard]] std::expected<std::uint64_t, std::error_code> file_size(std::string_view path) noexcept;

// Remove a file if present; missing files are not an error
[[nodiscard]] std::error_code remove_file(std::string_view path) noexcept;

} // namespace haul::disk
