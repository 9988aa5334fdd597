// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace haul::core {

// One remote file and where it goes. Immutable once a task is built from it.
struct ResourceRef {
    std::string source_url;
    std::string destination_path;
    std::optional<std::uint64_t> expected_size;
};

// http(s) URL and a non-empty destination
[[nodiscard]] std::error_code validate(const ResourceRef& ref) noexcept;

// One entry of an already-listed remote directory
struct ListingEntry {
    std::string relative_path;
    std::optional<std::uint64_t> size;
};

// Map a listing under `base_url` onto `destination_root`, keeping the relative
// directory structure. Absolute paths and ".." components are rejected.
[[nodiscard]] std::expected<std::vector<ResourceRef>, std::error_code>
build_refs(std::string_view base_url,
           const std::vector<ListingEntry>& listing,
           std::string_view destination_root);

} // namespace haul::core
