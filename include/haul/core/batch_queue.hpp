// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/config.hpp>
#include <haul/core/error.hpp>
#include <haul/core/events.hpp>
#include <haul/core/range_fetcher.hpp>
#include <haul/core/resource.hpp>
#include <haul/core/transfer_task.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace haul::core {

class BatchQueue;

// Control signal of a whole job
enum class JobControl : std::uint8_t {
    running,
    paused,
    cancelled
};

// Aggregate progress of a job. Tasks whose size is unknown are counted apart
// so that bytes_total never pretends to cover them.
struct BatchProgress {
    std::size_t task_count{0};
    std::uint64_t bytes_done{0};
    std::uint64_t bytes_total{0};          // sum over tasks with a known size
    std::uint64_t known_bytes_done{0};     // bytes_done of those same tasks
    std::size_t unknown_size_tasks{0};
    std::uint64_t unknown_size_bytes{0};
    std::uint64_t rate_bps{0};
    std::array<std::size_t, 7> by_state{};

    [[nodiscard]] std::size_t count(TransferState state) const noexcept {
        return by_state[static_cast<std::size_t>(state)];
    }
};

// Final (or current) outcome of one task, for reporting
struct TaskReport {
    std::size_t index{0};
    ResourceRef ref;
    TransferState state{TransferState::pending};
    std::uint64_t bytes_done{0};
    std::optional<std::uint64_t> bytes_total;
    std::error_code error;
    std::string reason;
};

// Ordered set of transfers submitted together. Owns its tasks; one task's
// failure never touches its siblings.
class BatchJob {
public:
    BatchJob(std::uint64_t id, BatchQueue* queue);

    BatchJob(const BatchJob&) = delete;
    BatchJob& operator=(const BatchJob&) = delete;

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] std::size_t size() const noexcept { return tasks_.size(); }
    [[nodiscard]] const std::shared_ptr<TransferTask>& task(std::size_t index) const { return tasks_.at(index); }
    [[nodiscard]] const std::vector<std::shared_ptr<TransferTask>>& tasks() const noexcept { return tasks_; }

    // Gate dispatch of this job and pause its active tasks
    void pause_all() noexcept;
    // Lift the gate and resume paused tasks
    void resume_all() noexcept;
    // Pending tasks never start; active ones stop cooperatively
    void cancel_all() noexcept;
    void cancel_all(bool delete_partial) noexcept;

    [[nodiscard]] JobControl control() const noexcept { return control_.load(std::memory_order_acquire); }

    [[nodiscard]] BatchProgress progress() const;
    [[nodiscard]] std::vector<TaskReport> report() const;

    // Summary state: terminal once every task is
    [[nodiscard]] TransferState state() const;

    // True when every task is terminal
    [[nodiscard]] bool done() const;

    void wait() const;
    [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout) const;

    // Until nothing of this job is running or scheduled to run
    [[nodiscard]] bool wait_settled(std::chrono::milliseconds timeout) const;

private:
    friend class BatchQueue;

    void notify() const;
    void detach() noexcept;
    [[nodiscard]] bool settled() const;

    std::uint64_t id_;
    std::vector<std::shared_ptr<TransferTask>> tasks_;
    std::atomic<JobControl> control_{JobControl::running};

    BatchQueue* queue_;   // cleared when the queue goes away
    std::mutex queue_mutex_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

// Bounded worker pool running the tasks of submitted jobs in submission order
class BatchQueue {
public:
    // A null fetcher means a libcurl HttpSession built from `config`.
    // Events are published only when a channel is given.
    explicit BatchQueue(EngineConfig config = {},
                        std::shared_ptr<RangeFetcher> fetcher = nullptr,
                        std::shared_ptr<EventChannel> events = nullptr);

    // Cancels in-flight work (partials kept) and joins the workers
    ~BatchQueue();

    BatchQueue(const BatchQueue&) = delete;
    BatchQueue& operator=(const BatchQueue&) = delete;

    // Rejects invalid refs and destinations already owned by a live task
    [[nodiscard]] std::expected<std::shared_ptr<BatchJob>, std::error_code>
    submit(std::vector<ResourceRef> refs);

    void pause_all() noexcept;
    void resume_all() noexcept;
    void cancel_all() noexcept;

    [[nodiscard]] std::size_t running() const noexcept { return running_.load(std::memory_order_relaxed); }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::shared_ptr<EventChannel>& events() const noexcept { return events_; }

private:
    friend class BatchJob;

    struct Ticket {
        std::shared_ptr<BatchJob> job;
        std::shared_ptr<TransferTask> task;
    };

    void enqueue(const std::weak_ptr<BatchJob>& job, const std::weak_ptr<TransferTask>& task);
    void wake() noexcept;
    void worker(std::stop_token stoken) noexcept;
    [[nodiscard]] std::deque<Ticket>::iterator next_ticket();
    [[nodiscard]] std::vector<std::shared_ptr<BatchJob>> live_jobs();
    void forward(const std::weak_ptr<BatchJob>& job, std::size_t index, const ProgressEvent& event);

    EngineConfig config_;
    std::shared_ptr<RangeFetcher> fetcher_;
    std::shared_ptr<EventChannel> events_;

    std::deque<Ticket> tickets_;
    std::vector<std::weak_ptr<BatchJob>> jobs_;
    std::uint64_t next_job_id_{1};
    bool gated_{false};
    std::atomic<std::size_t> running_{0};

    std::mutex submit_mutex_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::vector<std::jthread> workers_;
};

} // namespace haul::core
