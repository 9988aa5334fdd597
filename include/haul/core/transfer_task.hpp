// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/config.hpp>
#include <haul/core/error.hpp>
#include <haul/core/events.hpp>
#include <haul/core/progress.hpp>
#include <haul/core/range_fetcher.hpp>
#include <haul/core/resource.hpp>
#include <haul/core/stop_signal.hpp>
#include <haul/core/transfer_state.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace haul::core {

// Arranges for TransferTask::run() to be called on some thread
using TaskLauncher = std::function<void()>;

// One file's end-to-end transfer: probe, resume offset, chunk loop with retry,
// and pause/resume/cancel. All controls are idempotent and may be called from
// any thread.
class TransferTask {
public:
    TransferTask(ResourceRef ref, std::shared_ptr<RangeFetcher> fetcher, EngineConfig config = {});
    ~TransferTask();

    // Non-copyable, non-movable (owns a thread that points back at it)
    TransferTask(const TransferTask&) = delete;
    TransferTask& operator=(const TransferTask&) = delete;
    TransferTask(TransferTask&&) = delete;
    TransferTask& operator=(TransferTask&&) = delete;

    // Run on the caller's executor instead of a private thread. Set before start().
    void launcher(TaskLauncher launcher);

    // State changes and throttled progress samples (thread-safe)
    void callback(EventCallback cb) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(cb);
    }

    // Schedule a run from pending or a terminal state; acts as resume() when paused
    [[nodiscard]] std::error_code start() noexcept;

    // A start that has been scheduled but not yet entered is held until resume()
    void pause() noexcept;
    void resume() noexcept;

    // Partial data is kept unless deletion is requested
    void cancel() noexcept { cancel(config_.delete_partial_on_cancel); }
    void cancel(bool delete_partial) noexcept;

    // Execute scheduled work on the calling thread until none is left
    void run() noexcept;

    // Block until nothing is scheduled or running
    void wait_idle() const;
    [[nodiscard]] bool wait_idle(std::chrono::milliseconds timeout) const;

    [[nodiscard]] TransferState state() const noexcept;
    [[nodiscard]] TransferProgress progress() const noexcept;
    [[nodiscard]] std::string reason() const;
    [[nodiscard]] std::error_code error() const noexcept;
    [[nodiscard]] bool active() const noexcept;
    [[nodiscard]] bool running() const noexcept;

    [[nodiscard]] const ResourceRef& ref() const noexcept { return ref_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    enum class Action : std::uint8_t {
        none,
        start,
        resume
    };

    void launch();

    // Phases of one run; each returns once the task has settled
    [[nodiscard]] bool probe() noexcept;
    void download() noexcept;

    bool transition(TransferState to, std::error_code ec = {}, std::string why = {}) noexcept;
    void complete(std::uint64_t bytes, std::string note = {}) noexcept;
    void fail(std::error_code ec, std::string why) noexcept;
    void settle_stopped(std::uint64_t offset) noexcept;

    void save_record(std::uint64_t bytes) noexcept;
    void discard_partial() noexcept;
    void emit(bool state_change) noexcept;

    const ResourceRef ref_;
    std::shared_ptr<RangeFetcher> fetcher_;
    const EngineConfig config_;

    TaskLauncher launcher_;
    EventCallback callback_;
    std::mutex callback_mutex_;

    StopSignal stop_;

    // Guarded by mutex_
    TransferState state_{TransferState::pending};
    Action pending_{Action::none};
    bool active_{false};            // scheduled or running
    bool running_{false};           // inside run()
    bool delete_partial_{false};
    bool held_{false};              // scheduled start withdrawn by pause()
    std::error_code error_;
    std::string reason_;
    bool probed_{false};
    std::optional<std::uint64_t> total_;

    // Worker-only
    bool resumable_{false};
    RateMeter rate_;

    std::atomic<std::uint64_t> bytes_done_{0};
    std::atomic<std::uint64_t> rate_bps_{0};

    std::jthread thread_;
    std::mutex launch_mutex_;

    mutable std::mutex mutex_;
    mutable std::condition_variable idle_cv_;
};

} // namespace haul::core
