// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/disk/file_writer.hpp>
#include <cerrno>
#include <filesystem>
#include <utility>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace haul::disk {

std::error_code error_from_errno(int err) noexcept {
    switch (err) {
        case 0:             return {};
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:         return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:        return make_error_code(DiskErrc::invalid_path);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , position_(std::exchange(other.position_, 0))
    , path_(std::move(other.path_)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = std::exchange(other.fd_, -1);
        position_ = std::exchange(other.position_, 0);
        path_ = std::move(other.path_);
    }
    return *this;
}

std::error_code FileWriter::open(std::string_view path, std::uint64_t offset) noexcept {
    if (fd_ >= 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (path.empty()) {
        return make_error_code(DiskErrc::invalid_path);
    }

    try {
        path_ = std::string(path);
        std::filesystem::path p(path_);
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
            if (ec) {
                return error_from_errno(ec.value());
            }
        }
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::invalid_path);
    }

    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return error_from_errno(errno);
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        return error_from_errno(err);
    }
    if (static_cast<std::uint64_t>(st.st_size) < offset) {
        ::close(fd);
        return make_error_code(DiskErrc::invalid_path);
    }

    // Drop anything past the resume point before appending
    if (::ftruncate(fd, static_cast<off_t>(offset)) != 0 ||
        ::lseek(fd, static_cast<off_t>(offset), SEEK_SET) < 0) {
        int err = errno;
        ::close(fd);
        return error_from_errno(err);
    }

    fd_ = fd;
    position_ = offset;
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* bytes = static_cast<const char*>(data);
    std::size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd_, bytes + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return error_from_errno(errno);
        }
        written += static_cast<std::size_t>(n);
        position_ += static_cast<std::uint64_t>(n);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fsync(fd_) != 0) {
        return error_from_errno(errno);
    }
    return {};
}

std::error_code FileWriter::close() noexcept {
    if (fd_ < 0) {
        return {};
    }
    auto ec = flush();
    if (::close(fd_) != 0 && !ec) {
        ec = error_from_errno(errno);
    }
    fd_ = -1;
    return ec;
}

//=============================================================================
// Helpers
//=============================================================================

std::expected<std::uint64_t, std::error_code> file_size(std::string_view path) noexcept {
    struct stat st {};
    if (::stat(std::string(path).c_str(), &st) != 0) {
        return std::unexpected(error_from_errno(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

std::error_code remove_file(std::string_view path) noexcept {
    if (::unlink(std::string(path).c_str()) != 0 && errno != ENOENT) {
        return error_from_errno(errno);
    }
    return {};
}

} // namespace haul::disk
