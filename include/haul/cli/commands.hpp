// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/config.hpp>
#include <haul/core/resource.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace haul::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string output_dir{"."};
    std::string output_file;
    std::string config_file;
    std::string manifest_file;
    std::string filter;
    std::optional<std::uint32_t> jobs;
    std::optional<std::uint32_t> retries;
    bool info{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;      // set when the command line is unusable
};

// Already-listed remote directory: {"base_url": ..., "files": [{"path", "size"}]}
struct Manifest {
    std::string base_url;
    std::vector<core::ListingEntry> files;
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

[[nodiscard]] std::expected<Manifest, std::error_code> parse_manifest(std::string_view json_text) noexcept;
[[nodiscard]] std::expected<Manifest, std::error_code> load_manifest(std::string_view path) noexcept;

// Keep entries whose path contains `text`, ignoring case. Empty text keeps all.
[[nodiscard]] std::vector<core::ListingEntry>
filter_listing(const std::vector<core::ListingEntry>& files, std::string_view text);

// Turn URLs and/or the manifest into transfer targets
[[nodiscard]] std::expected<std::vector<core::ResourceRef>, std::error_code>
resolve_refs(const CliArgs& args) noexcept;

// Engine configuration from -c plus -j/-r overrides
[[nodiscard]] std::expected<core::EngineConfig, std::error_code>
resolve_config(const CliArgs& args) noexcept;

// Download everything; 0 only when every file completed
[[nodiscard]] CliResult download(const std::vector<core::ResourceRef>& refs,
                                 const core::EngineConfig& config,
                                 bool quiet) noexcept;

// Probe a URL without downloading
[[nodiscard]] CliResult info(const std::string& url, const core::EngineConfig& config) noexcept;

// Ctrl-C: cancel cooperatively, keeping partial files for the next run
void interrupt() noexcept;
[[nodiscard]] bool interrupted() noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace haul::cli
