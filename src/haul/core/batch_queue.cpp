// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/batch_queue.hpp>
#include <haul/core/http_session.hpp>
#include <haul/core/log.hpp>
#include <algorithm>
#include <filesystem>
#include <set>

namespace haul::core {

namespace {

std::string destination_key(const std::string& path) {
    return std::filesystem::path(path).lexically_normal().string();
}

} // namespace

//=============================================================================
// BatchJob
//=============================================================================

BatchJob::BatchJob(std::uint64_t id, BatchQueue* queue)
    : id_(id)
    , queue_(queue) {}

void BatchJob::pause_all() noexcept {
    auto expected = JobControl::running;
    control_.compare_exchange_strong(expected, JobControl::paused, std::memory_order_acq_rel);
    if (control() != JobControl::paused) return;

    for (auto& task : tasks_) {
        task->pause();
    }
    notify();
}

// Also resumes tasks that were paused one by one while the job kept running
void BatchJob::resume_all() noexcept {
    auto expected = JobControl::paused;
    control_.compare_exchange_strong(expected, JobControl::running, std::memory_order_acq_rel);
    if (control() == JobControl::cancelled) return;

    for (auto& task : tasks_) {
        task->resume();
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (queue_) {
        queue_->wake();
    }
}

void BatchJob::cancel_all() noexcept {
    control_.store(JobControl::cancelled, std::memory_order_release);
    for (auto& task : tasks_) {
        task->cancel();
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_) {
            queue_->wake();
        }
    }
    notify();
}

void BatchJob::cancel_all(bool delete_partial) noexcept {
    control_.store(JobControl::cancelled, std::memory_order_release);
    for (auto& task : tasks_) {
        task->cancel(delete_partial);
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_) {
            queue_->wake();
        }
    }
    notify();
}

BatchProgress BatchJob::progress() const {
    BatchProgress agg;
    agg.task_count = tasks_.size();

    for (const auto& task : tasks_) {
        auto p = task->progress();
        auto state = task->state();

        agg.bytes_done += p.bytes_done;
        agg.rate_bps += p.rate_bps;
        if (p.bytes_total) {
            agg.bytes_total += *p.bytes_total;
            agg.known_bytes_done += p.bytes_done;
        } else {
            ++agg.unknown_size_tasks;
            agg.unknown_size_bytes += p.bytes_done;
        }
        ++agg.by_state[static_cast<std::size_t>(state)];
    }
    return agg;
}

std::vector<TaskReport> BatchJob::report() const {
    std::vector<TaskReport> reports;
    reports.reserve(tasks_.size());

    for (std::size_t i = 0; i < tasks_.size(); ++i) {
        const auto& task = tasks_[i];
        auto p = task->progress();

        TaskReport r;
        r.index = i;
        r.ref = task->ref();
        r.state = task->state();
        r.bytes_done = p.bytes_done;
        r.bytes_total = p.bytes_total;
        r.error = task->error();
        r.reason = task->reason();
        reports.push_back(std::move(r));
    }
    return reports;
}

TransferState BatchJob::state() const {
    auto agg = progress();
    auto count = [&](TransferState s) { return agg.count(s); };

    auto terminal = count(TransferState::completed) + count(TransferState::failed) +
                    count(TransferState::cancelled);
    if (terminal == agg.task_count) {
        if (count(TransferState::failed) > 0) return TransferState::failed;
        if (count(TransferState::completed) == agg.task_count) return TransferState::completed;
        return TransferState::cancelled;
    }

    auto in_flight = count(TransferState::probing) + count(TransferState::downloading);
    if (in_flight == 0 && (control() == JobControl::paused || count(TransferState::paused) > 0)) {
        return TransferState::paused;
    }
    if (count(TransferState::pending) == agg.task_count) {
        return TransferState::pending;
    }
    return TransferState::downloading;
}

bool BatchJob::done() const {
    return std::all_of(tasks_.begin(), tasks_.end(),
                       [](const auto& task) { return is_terminal(task->state()); });
}

bool BatchJob::settled() const {
    bool gated = control() != JobControl::running;
    return std::all_of(tasks_.begin(), tasks_.end(), [gated](const auto& task) {
        return !task->running() && (gated || !task->active());
    });
}

void BatchJob::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return done(); });
}

bool BatchJob::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return done(); });
}

bool BatchJob::wait_settled(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return settled(); });
}

void BatchJob::notify() const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
    }
    cv_.notify_all();
}

void BatchJob::detach() noexcept {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_ = nullptr;
}

//=============================================================================
// BatchQueue
//=============================================================================

BatchQueue::BatchQueue(EngineConfig config,
                       std::shared_ptr<RangeFetcher> fetcher,
                       std::shared_ptr<EventChannel> events)
    : config_(std::move(config))
    , fetcher_(std::move(fetcher))
    , events_(std::move(events)) {
    if (auto ec = config_.validate()) {
        logger()->warn("batch queue: {}, clamping concurrency to 1..{}", ec.message(), MAX_CONCURRENCY);
    }
    auto slots = std::clamp<std::uint32_t>(config_.concurrency, 1, MAX_CONCURRENCY);

    if (!fetcher_) {
        fetcher_ = std::make_shared<HttpSession>(config_);
    }

    workers_.reserve(slots);
    for (std::uint32_t i = 0; i < slots; ++i) {
        workers_.emplace_back([this](std::stop_token stoken) { worker(stoken); });
    }
}

BatchQueue::~BatchQueue() {
    auto jobs = live_jobs();

    // From here on, tasks schedule themselves on private threads
    for (auto& job : jobs) {
        job->detach();
        for (auto& task : job->tasks_) {
            task->launcher({});
        }
    }

    for (auto& job : jobs) {
        job->cancel_all(false);
    }

    for (auto& w : workers_) {
        w.request_stop();
    }
    workers_.clear();

    // Tickets no worker picked up only need their scheduled flag cleared
    std::deque<Ticket> leftover;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leftover.swap(tickets_);
    }
    for (auto& ticket : leftover) {
        ticket.task->run();
        ticket.job->notify();
    }

    for (auto& job : jobs) {
        std::weak_ptr<BatchJob> job_w = job;
        for (auto& task : job->tasks_) {
            task->callback([job_w](const ProgressEvent& event) {
                auto owner = job_w.lock();
                if (owner && event.state_change) {
                    owner->notify();
                }
            });
        }
    }
}

std::expected<std::shared_ptr<BatchJob>, std::error_code>
BatchQueue::submit(std::vector<ResourceRef> refs) {
    std::lock_guard<std::mutex> submit_lock(submit_mutex_);

    std::set<std::string> destinations;
    for (const auto& ref : refs) {
        if (auto ec = validate(ref)) {
            logger()->error("rejecting {} -> {}: {}", ref.source_url, ref.destination_path, ec.message());
            return std::unexpected(ec);
        }
        if (!destinations.insert(destination_key(ref.destination_path)).second) {
            logger()->error("rejecting batch: {} appears twice", ref.destination_path);
            return std::unexpected(make_error_code(TransferErrc::duplicate_destination));
        }
    }

    for (const auto& job : live_jobs()) {
        for (const auto& task : job->tasks_) {
            if (!is_terminal(task->state()) &&
                destinations.contains(destination_key(task->ref().destination_path))) {
                logger()->error("rejecting batch: {} is owned by job {}",
                                task->ref().destination_path, job->id());
                return std::unexpected(make_error_code(TransferErrc::duplicate_destination));
            }
        }
    }

    auto job = std::make_shared<BatchJob>(next_job_id_++, this);
    std::weak_ptr<BatchJob> job_w = job;

    job->tasks_.reserve(refs.size());
    for (std::size_t i = 0; i < refs.size(); ++i) {
        auto task = std::make_shared<TransferTask>(std::move(refs[i]), fetcher_, config_);
        std::weak_ptr<TransferTask> task_w = task;

        task->callback([this, job_w, i](const ProgressEvent& event) {
            forward(job_w, i, event);
        });
        task->launcher([this, job_w, task_w] {
            enqueue(job_w, task_w);
        });
        job->tasks_.push_back(std::move(task));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::erase_if(jobs_, [](const auto& w) { return w.expired(); });
        jobs_.push_back(job);
    }

    // Tickets enter the queue in submission order
    for (auto& task : job->tasks_) {
        if (auto ec = task->start()) {
            logger()->error("{}: {}", task->ref().destination_path, ec.message());
        }
    }

    logger()->info("job {} queued: {} file(s)", job->id(), job->size());
    return job;
}

void BatchQueue::pause_all() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        gated_ = true;
    }
    for (auto& job : live_jobs()) {
        job->pause_all();
    }
}

void BatchQueue::resume_all() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        gated_ = false;
    }
    for (auto& job : live_jobs()) {
        job->resume_all();
    }
    wake();
}

void BatchQueue::cancel_all() noexcept {
    for (auto& job : live_jobs()) {
        job->cancel_all();
    }
    wake();
}

void BatchQueue::enqueue(const std::weak_ptr<BatchJob>& job_w, const std::weak_ptr<TransferTask>& task_w) {
    auto job = job_w.lock();
    auto task = task_w.lock();
    if (!job || !task) {
        return;
    }

    // A resumed task queues behind tickets that are still waiting for a first start
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tickets_.push_back(Ticket{std::move(job), std::move(task)});
    }
    cv_.notify_all();
}

void BatchQueue::wake() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
    }
    cv_.notify_all();
}

std::deque<BatchQueue::Ticket>::iterator BatchQueue::next_ticket() {
    for (auto it = tickets_.begin(); it != tickets_.end(); ++it) {
        // Settled tasks only need their ticket retired; the gate does not apply
        if (is_terminal(it->task->state())) {
            return it;
        }
        if (gated_ || it->job->control() == JobControl::paused) {
            continue;
        }
        return it;
    }
    return tickets_.end();
}

void BatchQueue::worker(std::stop_token stoken) noexcept {
    for (;;) {
        Ticket ticket;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            auto it = tickets_.end();
            bool ready = cv_.wait(lock, stoken, [&] {
                it = next_ticket();
                return it != tickets_.end();
            });
            if (!ready || stoken.stop_requested()) {
                return;
            }
            ticket = std::move(*it);
            tickets_.erase(it);
        }

        running_.fetch_add(1, std::memory_order_relaxed);
        ticket.task->run();
        running_.fetch_sub(1, std::memory_order_relaxed);
        ticket.job->notify();
    }
}

std::vector<std::shared_ptr<BatchJob>> BatchQueue::live_jobs() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<BatchJob>> jobs;
    jobs.reserve(jobs_.size());
    for (const auto& w : jobs_) {
        if (auto job = w.lock()) {
            jobs.push_back(std::move(job));
        }
    }
    return jobs;
}

void BatchQueue::forward(const std::weak_ptr<BatchJob>& job_w, std::size_t index, const ProgressEvent& event) {
    auto job = job_w.lock();
    if (!job) return;

    if (events_) {
        ProgressEvent task_event = event;
        task_event.job_id = job->id();
        task_event.task_index = index;
        events_->publish(std::move(task_event));

        if (event.state_change) {
            auto agg = job->progress();

            ProgressEvent batch_event;
            batch_event.scope = EventScope::batch;
            batch_event.job_id = job->id();
            batch_event.state = job->state();
            batch_event.state_change = true;
            batch_event.bytes_done = agg.bytes_done;
            if (agg.unknown_size_tasks == 0) {
                batch_event.bytes_total = agg.bytes_total;
            }
            batch_event.rate_bps = agg.rate_bps;
            batch_event.eta_seconds = estimate_eta(agg.bytes_done, batch_event.bytes_total, agg.rate_bps);
            events_->publish(std::move(batch_event));
        }
    }

    if (event.state_change) {
        job->notify();
        wake();
    }
}

} // namespace haul::core
