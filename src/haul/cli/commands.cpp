// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/cli/commands.hpp>
#include <haul/cli/progress_bar.hpp>
#include <haul/core/batch_queue.hpp>
#include <haul/core/events.hpp>
#include <haul/core/http_session.hpp>
#include <haul/core/log.hpp>
#include <haul/core/url.hpp>
#include <haul/disk/error.hpp>
#include <haul/version.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <sstream>

using namespace haul::core;

namespace chrono = std::chrono;

namespace haul::cli {

namespace {

std::atomic<bool> g_interrupted{false};

std::optional<std::uint32_t> parse_count(std::string_view text) {
    std::uint32_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::string to_lower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    // Options that take a value
    auto value = [&](int& i, std::string_view name) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        args.error = std::string("missing value for ") + std::string(name);
        return nullptr;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info = true;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = value(i, arg)) args.output_file = v;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value(i, arg)) args.output_dir = v;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value(i, arg)) args.config_file = v;
        } else if (arg == "-m" || arg == "--manifest") {
            if (auto v = value(i, arg)) args.manifest_file = v;
        } else if (arg == "-f" || arg == "--filter") {
            if (auto v = value(i, arg)) args.filter = v;
        } else if (arg == "-j" || arg == "--jobs") {
            if (auto v = value(i, arg)) {
                args.jobs = parse_count(v);
                if (!args.jobs) args.error = "invalid value for " + arg + ": " + v;
            }
        } else if (arg == "-r" || arg == "--retries") {
            if (auto v = value(i, arg)) {
                args.retries = parse_count(v);
                if (!args.retries) args.error = "invalid value for " + arg + ": " + v;
            }
        } else if (arg.starts_with("http://") || arg.starts_with("https://")) {
            // URL arguments (no option)
            args.urls.push_back(arg);
        } else {
            args.error = "unknown argument: " + arg;
        }

        if (!args.error.empty()) {
            return args;
        }
    }

    return args;
}

//=============================================================================
// Manifest
//=============================================================================

std::expected<Manifest, std::error_code> parse_manifest(std::string_view json_text) noexcept {
    try {
        auto j = nlohmann::json::parse(json_text);

        Manifest manifest;
        manifest.base_url = j.at("base_url").get<std::string>();
        for (const auto& file : j.at("files")) {
            ListingEntry entry;
            entry.relative_path = file.at("path").get<std::string>();
            if (file.contains("size") && !file["size"].is_null()) {
                entry.size = file["size"].get<std::uint64_t>();
            }
            manifest.files.push_back(std::move(entry));
        }
        return manifest;
    } catch (const nlohmann::json::exception& e) {
        logger()->error("invalid manifest: {}", e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    } catch (const std::exception& e) {
        logger()->error("reading manifest: {}", e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    }
}

std::expected<Manifest, std::error_code> load_manifest(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path)};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return parse_manifest(buffer.str());
    } catch (const std::exception& e) {
        logger()->error("reading {}: {}", path, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::vector<ListingEntry> filter_listing(const std::vector<ListingEntry>& files, std::string_view text) {
    if (text.empty()) {
        return files;
    }

    auto needle = to_lower(text);
    std::vector<ListingEntry> kept;
    std::copy_if(files.begin(), files.end(), std::back_inserter(kept), [&](const ListingEntry& e) {
        return to_lower(e.relative_path).find(needle) != std::string::npos;
    });
    return kept;
}

//=============================================================================
// Resolution
//=============================================================================

std::expected<std::vector<ResourceRef>, std::error_code> resolve_refs(const CliArgs& args) noexcept {
    try {
        std::vector<ResourceRef> refs;
        std::filesystem::path dir{args.output_dir.empty() ? std::string(".") : args.output_dir};

        for (const auto& url : args.urls) {
            auto parsed = Url::parse(url);
            if (!parsed) {
                std::cerr << "Error: Invalid URL: " << url << std::endl;
                return std::unexpected(parsed.error());
            }

            ResourceRef ref;
            ref.source_url = url;
            if (!args.output_file.empty() && args.urls.size() == 1) {
                ref.destination_path = (dir / args.output_file).lexically_normal().string();
            } else {
                // Multiple URLs: generate filename from URL
                ref.destination_path = (dir / parsed->filename()).lexically_normal().string();
            }
            refs.push_back(std::move(ref));
        }

        if (!args.manifest_file.empty()) {
            auto manifest = load_manifest(args.manifest_file);
            if (!manifest) {
                std::cerr << "Error: cannot load manifest " << args.manifest_file << ": "
                          << manifest.error().message() << std::endl;
                return std::unexpected(manifest.error());
            }

            auto selected = filter_listing(manifest->files, args.filter);
            if (selected.empty()) {
                std::cerr << "Error: no manifest entries match '" << args.filter << "'" << std::endl;
                return std::unexpected(make_error_code(TransferErrc::invalid_config));
            }

            auto listed = build_refs(manifest->base_url, selected, dir.string());
            if (!listed) {
                std::cerr << "Error: bad manifest: " << listed.error().message() << std::endl;
                return std::unexpected(listed.error());
            }
            std::move(listed->begin(), listed->end(), std::back_inserter(refs));
        }

        return refs;
    } catch (const std::exception& e) {
        logger()->error("resolving targets: {}", e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_path));
    }
}

std::expected<EngineConfig, std::error_code> resolve_config(const CliArgs& args) noexcept {
    EngineConfig config;
    if (!args.config_file.empty()) {
        auto loaded = EngineConfig::load(args.config_file);
        if (!loaded) {
            std::cerr << "Error: cannot load config " << args.config_file << ": "
                      << loaded.error().message() << std::endl;
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (args.jobs) config.concurrency = *args.jobs;
    if (args.retries) config.retry_limit = *args.retries;

    if (auto ec = config.validate()) {
        std::cerr << "Error: " << ec.message() << std::endl;
        return std::unexpected(ec);
    }
    return config;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const std::vector<ResourceRef>& refs, const EngineConfig& config, bool quiet) noexcept {
    try {
        HttpSession::global_init();

        auto channel = std::make_shared<EventChannel>();
        std::vector<TaskReport> reports;
        bool was_interrupted = false;
        {
            BatchQueue queue(config, nullptr, channel);

            auto job = queue.submit(refs);
            if (!job) {
                std::cerr << "Error: " << job.error().message() << std::endl;
                HttpSession::global_cleanup();
                return std::unexpected(job.error());
            }

            ProgressBar bar(refs.size() == 1 ? "Downloading" : fmt::format("{} files", refs.size()));
            std::mutex out_mutex;

            EventPump pump(channel, [&](const ProgressEvent& event) {
                if (quiet || event.scope != EventScope::task) return;

                std::lock_guard<std::mutex> lock(out_mutex);
                if (event.state_change && is_terminal(event.state)) {
                    bar.clear();
                    if (event.state == TransferState::failed) {
                        std::cout << "  failed " << event.destination << ": " << event.reason << "\n";
                    } else if (event.state == TransferState::completed && !event.reason.empty()) {
                        std::cout << "  skipped " << event.destination << " (" << event.reason << ")\n";
                    } else {
                        std::cout << "  " << to_string(event.state) << " " << event.destination << "\n";
                    }
                }

                auto agg = (*job)->progress();
                std::optional<std::uint64_t> total;
                if (agg.unknown_size_tasks == 0) total = agg.bytes_total;
                bar.update(agg.bytes_done, total, agg.rate_bps,
                           estimate_eta(agg.bytes_done, total, agg.rate_bps));
            });

            while (!(*job)->wait_for(chrono::milliseconds(200))) {
                if (interrupted() && !was_interrupted) {
                    was_interrupted = true;
                    queue.cancel_all();
                }
            }

            pump.stop();
            if (!quiet) bar.finish();
            reports = (*job)->report();
        }

        HttpSession::global_cleanup();

        std::size_t completed = 0;
        for (const auto& r : reports) {
            if (r.state == TransferState::completed) ++completed;
        }

        if (!quiet) {
            std::cout << "\n" << completed << "/" << reports.size() << " completed\n";
            for (const auto& r : reports) {
                if (r.state == TransferState::completed) continue;
                std::cout << "  " << to_string(r.state) << ": " << r.ref.destination_path;
                if (!r.reason.empty() && r.state == TransferState::failed) {
                    std::cout << " (" << r.reason << ")";
                }
                std::cout << "\n";
            }
            if (was_interrupted) {
                std::cout << "Interrupted; partial files kept, run again to resume\n";
            }
            std::cout << std::flush;
        }

        return completed == reports.size() ? 0 : 1;
    } catch (const std::exception& e) {
        logger()->error("download: {}", e.what());
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }
}

CliResult info(const std::string& url, const EngineConfig& config) noexcept {
    HttpSession::global_init();

    HttpSession session(config);
    StopSignal stop;
    auto response = session.head(url, stop);

    HttpSession::global_cleanup();

    if (!response) {
        std::cout << "Error: " << response.error().message() << std::endl;
        return std::unexpected(response.error());
    }

    std::cout << "URL: " << url << std::endl;
    std::cout << "Status: " << response->status_code << std::endl;
    std::cout << "Content-Type: " << response->content_type << std::endl;
    if (response->content_length) {
        std::cout << "Content-Length: " << *response->content_length
                  << " (" << format_bytes(*response->content_length) << ")" << std::endl;
    } else {
        std::cout << "Content-Length: unknown" << std::endl;
    }
    std::cout << "Accepts-Ranges: " << (response->accepts_ranges ? "yes" : "no") << std::endl;
    if (!response->filename.empty()) {
        std::cout << "Filename: " << response->filename << std::endl;
    }

    return 0;
}

void interrupt() noexcept {
    g_interrupted.store(true, std::memory_order_relaxed);
}

bool interrupted() noexcept {
    return g_interrupted.load(std::memory_order_relaxed);
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "haul " << program_name << " - resumable HTTP downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>...\n";
    std::cout << "  " << program_name << " [OPTIONS] -m <MANIFEST>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -o, --output <FILE>     Save to specified file (single URL)\n";
    std::cout << "  -d, --directory <DIR>   Save to specified directory (default: .)\n";
    std::cout << "  -j, --jobs <N>          Concurrent transfers (1-" << MAX_CONCURRENCY
              << ", default: " << DEFAULT_CONCURRENCY << ")\n";
    std::cout << "  -r, --retries <N>       Retries per transfer (default: " << RETRY_COUNT << ")\n";
    std::cout << "  -c, --config <FILE>     Load engine settings from JSON\n";
    std::cout << "  -m, --manifest <FILE>   Download files listed in a JSON manifest\n";
    std::cout << "  -f, --filter <TEXT>     Only manifest entries whose path contains TEXT\n";
    std::cout << "  -i, --info              Show file info without downloading\n";
    std::cout << "\n";
    std::cout << "Interrupted transfers resume where they stopped when run again.\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -o myfile.zip https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -m model.json -f safetensors -d ./model\n";
}

void print_version() noexcept {
    std::cout << "haul " << haul::version.to_string() << std::endl;
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann/json\n";
}

} // namespace haul::cli
