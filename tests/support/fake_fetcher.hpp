// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/range_fetcher.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace haul::test {

// Scripted behaviour of one URL served by FakeFetcher
struct FakeResource {
    std::string payload;
    bool accepts_ranges{true};
    bool honor_range{true};                       // false: range requests fail with range_ignored
    bool report_size{true};
    std::optional<std::uint64_t> reported_size;   // overrides payload.size() in probe
    std::deque<std::uint64_t> cut_after;          // per attempt: bytes delivered before the drop
    bool fail_every{false};                       // every fetch fails before the first byte
    std::error_code fetch_error{core::TransferErrc::connection_lost};
    std::error_code probe_error;                  // probe always fails with this
    std::uint32_t probe_failures{0};              // transient probe failures before success
    std::optional<std::uint64_t> hold_after;      // park at this offset until release()
};

// In-memory RangeFetcher with call accounting
class FakeFetcher final : public core::RangeFetcher {
public:
    std::size_t chunk_size{1024};
    std::chrono::milliseconds chunk_delay{0};

    void add(const std::string& url, FakeResource resource) {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_[url] = std::move(resource);
    }

    // Let parked fetches run to the end
    void release() noexcept { released_.store(true); }

    [[nodiscard]] std::vector<std::uint64_t> offsets(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = offsets_.find(url);
        return it == offsets_.end() ? std::vector<std::uint64_t>{} : it->second;
    }

    [[nodiscard]] std::size_t fetch_calls(const std::string& url) const { return offsets(url).size(); }

    [[nodiscard]] std::size_t probe_calls(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = probes_.find(url);
        return it == probes_.end() ? 0 : it->second;
    }

    [[nodiscard]] int active() const noexcept { return active_.load(); }
    [[nodiscard]] int max_active() const noexcept { return max_active_.load(); }
    [[nodiscard]] int holding() const noexcept { return holding_.load(); }

    std::expected<core::ProbeInfo, std::error_code>
    probe(const std::string& url, const core::StopSignal& stop) noexcept override {
        if (stop.stop_requested()) {
            return std::unexpected(make_error_code(core::TransferErrc::cancelled));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ++probes_[url];
        auto it = resources_.find(url);
        if (it == resources_.end()) {
            return std::unexpected(make_error_code(core::TransferErrc::not_found));
        }
        auto& res = it->second;
        if (res.probe_failures > 0) {
            --res.probe_failures;
            return std::unexpected(make_error_code(core::TransferErrc::timeout));
        }
        if (res.probe_error) {
            return std::unexpected(res.probe_error);
        }

        core::ProbeInfo info;
        info.status_code = 200;
        info.accepts_ranges = res.accepts_ranges;
        if (res.report_size) {
            info.total_size = res.reported_size ? *res.reported_size : res.payload.size();
        }
        return info;
    }

    core::FetchOutcome fetch(const std::string& url,
                             std::uint64_t start_offset,
                             disk::ByteSink& sink,
                             const core::StopSignal& stop,
                             const core::ChunkCallback& on_chunk) noexcept override {
        ActiveGuard guard(*this);

        FakeResource res;
        std::optional<std::uint64_t> cut;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            offsets_[url].push_back(start_offset);
            auto it = resources_.find(url);
            if (it == resources_.end()) {
                return core::FetchOutcome::failed(0, make_error_code(core::TransferErrc::not_found));
            }
            if (!it->second.cut_after.empty()) {
                cut = it->second.cut_after.front();
                it->second.cut_after.pop_front();
            }
            res = it->second;
        }

        if (start_offset > 0 && !res.honor_range) {
            return core::FetchOutcome::failed(0, make_error_code(core::TransferErrc::range_ignored),
                                              "server answered 200 to a range request");
        }
        if (res.fail_every) {
            return core::FetchOutcome::failed(0, res.fetch_error);
        }

        const std::uint64_t size = res.payload.size();
        std::uint64_t limit = size;
        if (cut) {
            limit = std::min<std::uint64_t>(start_offset + *cut, size);
        }

        std::uint64_t pos = start_offset;
        std::uint64_t written = 0;
        while (pos < limit) {
            if (res.hold_after && pos >= *res.hold_after && !released_.load()) {
                holding_.fetch_add(1);
                bool stopped = false;
                while (!released_.load()) {
                    if (stop.wait_for(std::chrono::milliseconds{2})) {
                        stopped = true;
                        break;
                    }
                }
                holding_.fetch_sub(1);
                if (stopped) {
                    return core::FetchOutcome::cancelled(written);
                }
            }
            if (stop.stop_requested()) {
                return core::FetchOutcome::cancelled(written);
            }

            auto n = std::min<std::uint64_t>(chunk_size, limit - pos);
            if (res.hold_after && pos < *res.hold_after) {
                n = std::min<std::uint64_t>(n, *res.hold_after - pos);
            }
            if (auto ec = sink.write(res.payload.data() + pos, static_cast<std::size_t>(n))) {
                return core::FetchOutcome::failed(written, ec);
            }
            pos += n;
            written += n;
            if (on_chunk) {
                on_chunk(n);
            }
            if (chunk_delay.count() > 0) {
                std::this_thread::sleep_for(chunk_delay);
            }
        }

        if (limit < size) {
            return core::FetchOutcome::failed(written, res.fetch_error);
        }
        return core::FetchOutcome::completed(written);
    }

private:
    struct ActiveGuard {
        explicit ActiveGuard(FakeFetcher& f) : fetcher(f) {
            int now = fetcher.active_.fetch_add(1) + 1;
            int seen = fetcher.max_active_.load();
            while (now > seen && !fetcher.max_active_.compare_exchange_weak(seen, now)) {}
        }
        ~ActiveGuard() { fetcher.active_.fetch_sub(1); }
        FakeFetcher& fetcher;
    };

    mutable std::mutex mutex_;
    std::map<std::string, FakeResource> resources_;
    std::map<std::string, std::vector<std::uint64_t>> offsets_;
    std::map<std::string, std::size_t> probes_;

    std::atomic<bool> released_{false};
    std::atomic<int> active_{0};
    std::atomic<int> max_active_{0};
    std::atomic<int> holding_{0};
};

// Poll until `pred` holds or the deadline passes
template<typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds{5}) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds{2});
    }
    return pred();
}

} // namespace haul::test
