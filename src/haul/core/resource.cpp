// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/resource.hpp>
#include <haul/core/log.hpp>
#include <haul/core/url.hpp>
#include <filesystem>

namespace haul::core {

namespace {

bool is_safe_relative(std::string_view relative) {
    if (relative.empty() || relative.front() == '/' || relative.front() == '\\') {
        return false;
    }
    std::filesystem::path p{std::string(relative)};
    if (p.is_absolute() || p.has_root_name()) {
        return false;
    }
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

} // namespace

std::error_code validate(const ResourceRef& ref) noexcept {
    auto url = Url::parse(ref.source_url);
    if (!url || !url->is_http()) {
        return make_error_code(TransferErrc::invalid_url);
    }
    if (ref.destination_path.empty()) {
        return make_error_code(TransferErrc::invalid_path);
    }
    return {};
}

std::expected<std::vector<ResourceRef>, std::error_code>
build_refs(std::string_view base_url,
           const std::vector<ListingEntry>& listing,
           std::string_view destination_root) {
    auto base = Url::parse(base_url);
    if (!base || !base->is_http()) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }

    std::filesystem::path root{destination_root.empty() ? std::string(".") : std::string(destination_root)};

    std::vector<ResourceRef> refs;
    refs.reserve(listing.size());
    for (const auto& entry : listing) {
        if (!is_safe_relative(entry.relative_path)) {
            logger()->error("rejecting listing entry '{}'", entry.relative_path);
            return std::unexpected(make_error_code(TransferErrc::invalid_path));
        }

        ResourceRef ref;
        ref.source_url = base->join(entry.relative_path);
        ref.destination_path = (root / entry.relative_path).lexically_normal().string();
        ref.expected_size = entry.size;
        refs.push_back(std::move(ref));
    }
    return refs;
}

} // namespace haul::core
