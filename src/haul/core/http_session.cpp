// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/http_session.hpp>
#include <haul/core/log.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace haul::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

std::string to_lower(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

std::string_view trim(std::string_view value) noexcept {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' ||
                              value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return value;
}

std::optional<std::uint64_t> parse_u64(std::string_view text) noexcept {
    text = trim(text);
    std::uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

// Collect headers; a new status line starts a new hop, so earlier redirect
// headers are discarded.
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    try {
        std::string_view header(buffer, total);
        if (header.starts_with("HTTP/")) {
            headers->clear();
            return total;
        }

        auto colon = header.find(':');
        if (colon == std::string_view::npos) return total;

        (*headers)[to_lower(header.substr(0, colon))] = std::string(trim(header.substr(colon + 1)));
    } catch (const std::exception&) {
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    return total;
}

struct TransferContext {
    CURL* curl{nullptr};
    disk::ByteSink* sink{nullptr};
    const StopSignal* stop{nullptr};
    const ChunkCallback* on_chunk{nullptr};
    std::uint64_t start_offset{0};
    std::map<std::string, std::string> headers;
    std::uint64_t written{0};
    bool validated{false};
    bool stopped{false};
    std::error_code abort_error;
    std::string abort_reason;
};

// Check status and Content-Range before the first body byte is accepted
std::error_code validate_response(TransferContext& ctx) {
    long code = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &code);

    if (auto ec = error_from_http_status(code)) {
        ctx.abort_reason = "HTTP " + std::to_string(code) + ": " + ec.message();
        return ec;
    }

    if (ctx.start_offset == 0 && code != 206) {
        return {};
    }

    if (code != 206) {
        ctx.abort_reason = "server answered " + std::to_string(code) + " to a range request";
        return make_error_code(TransferErrc::range_ignored);
    }

    auto it = ctx.headers.find("content-range");
    auto range = it != ctx.headers.end()
        ? HttpSession::parse_content_range(it->second)
        : std::nullopt;
    if (!range) {
        ctx.abort_reason = "206 response without a usable Content-Range";
        return make_error_code(TransferErrc::range_ignored);
    }
    if (range->first != ctx.start_offset) {
        ctx.abort_reason = "Content-Range starts at " + std::to_string(range->first) +
                           ", requested " + std::to_string(ctx.start_offset);
        return make_error_code(TransferErrc::range_ignored);
    }
    return {};
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    std::size_t bytes = size * nmemb;

    if (ctx->stop->stop_requested()) {
        ctx->stopped = true;
        return 0;
    }

    try {
        if (!ctx->validated) {
            if (auto ec = validate_response(*ctx)) {
                ctx->abort_error = ec;
                return 0;
            }
            ctx->validated = true;
        }

        if (auto ec = ctx->sink->write(ptr, bytes)) {
            ctx->abort_error = ec;
            ctx->abort_reason = "write failed: " + ec.message();
            return 0;
        }
        ctx->written += bytes;

        if (*ctx->on_chunk) {
            (*ctx->on_chunk)(bytes);
        }
    } catch (const std::exception& e) {
        ctx->abort_error = make_error_code(TransferErrc::network_error);
        ctx->abort_reason = e.what();
        return 0;
    }
    return bytes;
}

// Checks the stop signal even while no body bytes arrive
int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<const StopSignal*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

std::error_code map_curl_error(CURLcode result) noexcept {
    switch (result) {
        case CURLE_OK:
            return {};
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(TransferErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(TransferErrc::dns_error);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(TransferErrc::refused);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
        case CURLE_SSL_CONNECT_ERROR:
            return make_error_code(TransferErrc::connection_lost);
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(TransferErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(TransferErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(TransferErrc::invalid_url);
        case CURLE_RANGE_ERROR:
            return make_error_code(TransferErrc::range_ignored);
        default:
            return make_error_code(TransferErrc::network_error);
    }
}

std::string describe_curl_error(CURLcode result, const char* errbuf) {
    std::string text = curl_easy_strerror(result);
    if (errbuf && errbuf[0] != '\0') {
        text += ": ";
        text += errbuf;
    }
    return text;
}

void apply_common_options(CURL* curl, const EngineConfig& cfg, const std::string& url, char* errbuf) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }

    // Timeouts: connect, then "read" as a low-speed window
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(cfg.read_timeout_sec));

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, cfg.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, cfg.verify_tls ? 2L : 0L);

    if (cfg.proxy) {
        curl_easy_setopt(curl, CURLOPT_PROXY, cfg.proxy->c_str());
    }

    curl_easy_setopt(curl, CURLOPT_USERAGENT, cfg.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(EngineConfig config)
    : config_(std::move(config)) {}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url, const StopSignal& stop) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }

    HttpResponse response{};
    char errbuf[CURL_ERROR_SIZE] = {};

    apply_common_options(curl.ptr, config_, url, errbuf);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);

    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result == CURLE_ABORTED_BY_CALLBACK && stop.stop_requested()) {
        return std::unexpected(make_error_code(TransferErrc::cancelled));
    }
    if (result != CURLE_OK) {
        logger()->debug("HEAD {}: {}", url, describe_curl_error(result, errbuf));
        return std::unexpected(map_curl_error(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    // Some servers refuse HEAD; the size is then learned from the GET
    if (http_code == 405 || http_code == 501) {
        return response;
    }
    if (auto ec = error_from_http_status(http_code)) {
        logger()->debug("HEAD {}: HTTP {}", url, http_code);
        return std::unexpected(ec);
    }

    try {
        auto cl_it = response.headers.find("content-length");
        if (cl_it != response.headers.end()) {
            response.content_length = parse_u64(cl_it->second);
        }

        auto ct_it = response.headers.find("content-type");
        if (ct_it != response.headers.end()) {
            response.content_type = ct_it->second;
        }

        // Absent header means "unknown"; only an explicit "none" rules ranges out
        auto ar_it = response.headers.find("accept-ranges");
        response.accepts_ranges = ar_it == response.headers.end() ||
                                  to_lower(ar_it->second).find("bytes") != std::string::npos;

        auto cd_it = response.headers.find("content-disposition");
        if (cd_it != response.headers.end()) {
            response.filename = parse_content_disposition(cd_it->second);
        }
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }

    return response;
}

std::expected<ProbeInfo, std::error_code>
HttpSession::probe(const std::string& url, const StopSignal& stop) noexcept {
    auto response = head(url, stop);
    if (!response) {
        return std::unexpected(response.error());
    }

    ProbeInfo info;
    info.status_code = response->status_code;
    info.total_size = response->content_length;
    info.accepts_ranges = response->accepts_ranges;
    info.content_type = std::move(response->content_type);
    info.filename = std::move(response->filename);
    return info;
}

FetchOutcome HttpSession::fetch(const std::string& url,
                                std::uint64_t start_offset,
                                disk::ByteSink& sink,
                                const StopSignal& stop,
                                const ChunkCallback& on_chunk) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return FetchOutcome::failed(0, make_error_code(TransferErrc::network_error),
                                        "curl_easy_init failed");
        }

        TransferContext ctx;
        ctx.curl = curl.ptr;
        ctx.sink = &sink;
        ctx.stop = &stop;
        ctx.on_chunk = &on_chunk;
        ctx.start_offset = start_offset;

        char errbuf[CURL_ERROR_SIZE] = {};
        apply_common_options(curl.ptr, config_, url, errbuf);

        // "N-" becomes "Range: bytes=N-"
        std::string range;
        if (start_offset > 0) {
            range = std::to_string(start_offset) + "-";
            curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
        }

        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ctx.headers);

        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);

        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &stop);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

        // Small receive blocks keep cancel latency within one block
        curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(config_.buffer_size));

        CURLcode result = curl_easy_perform(curl.ptr);

        if (ctx.stopped || (result == CURLE_ABORTED_BY_CALLBACK && stop.stop_requested())) {
            return FetchOutcome::cancelled(ctx.written);
        }
        if (ctx.abort_error) {
            return FetchOutcome::failed(ctx.written, ctx.abort_error, ctx.abort_reason);
        }
        if (result != CURLE_OK) {
            return FetchOutcome::failed(ctx.written, map_curl_error(result),
                                        describe_curl_error(result, errbuf));
        }

        // Empty bodies never reach the write callback
        if (!ctx.validated) {
            if (auto ec = validate_response(ctx)) {
                return FetchOutcome::failed(ctx.written, ec, ctx.abort_reason);
            }
        }

        return FetchOutcome::completed(ctx.written);
    } catch (const std::exception& e) {
        return FetchOutcome::failed(0, make_error_code(TransferErrc::network_error), e.what());
    }
}

std::optional<ContentRange> HttpSession::parse_content_range(std::string_view value) noexcept {
    // "bytes 100-199/1000" or "bytes 100-199/*"
    value = trim(value);
    if (!value.starts_with("bytes")) return std::nullopt;
    value.remove_prefix(5);
    value = trim(value);

    auto dash = value.find('-');
    auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    auto first = parse_u64(value.substr(0, dash));
    auto last = parse_u64(value.substr(dash + 1, slash - dash - 1));
    if (!first || !last || *last < *first) return std::nullopt;

    ContentRange range;
    range.first = *first;
    range.last = *last;
    auto total_text = trim(value.substr(slash + 1));
    if (total_text != "*") {
        range.total = parse_u64(total_text);
        if (!range.total) return std::nullopt;
    }
    return range;
}

std::string HttpSession::parse_content_disposition(std::string_view content_disposition) {
    // Parse "attachment; filename=file.zip"
    auto filename_pos = content_disposition.find("filename=");
    if (filename_pos == std::string_view::npos) {
        return {};
    }
    auto filename = trim(content_disposition.substr(filename_pos + 9));
    auto semicolon = filename.find(';');
    if (semicolon != std::string_view::npos) {
        filename = trim(filename.substr(0, semicolon));
    }
    if (filename.size() >= 2 && (filename.front() == '"' || filename.front() == '\'') &&
        filename.back() == filename.front()) {
        filename.remove_prefix(1);
        filename.remove_suffix(1);
    }
    return std::string(filename);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    if (auto rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK) {
        logger()->error("curl_global_init failed: {}", curl_easy_strerror(rc));
    }
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace haul::core
