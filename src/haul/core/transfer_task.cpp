// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/transfer_task.hpp>
#include <haul/core/log.hpp>
#include <haul/core/resume_ledger.hpp>
#include <haul/disk/file_writer.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <utility>

namespace haul::core {

TransferTask::TransferTask(ResourceRef ref, std::shared_ptr<RangeFetcher> fetcher, EngineConfig config)
    : ref_(std::move(ref))
    , fetcher_(std::move(fetcher))
    , config_(std::move(config)) {
    total_ = ref_.expected_size;
}

TransferTask::~TransferTask() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = Action::none;
        if (running_) {
            stop_.request(StopReason::cancel);
        }
    }

    std::lock_guard<std::mutex> launch_lock(launch_mutex_);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void TransferTask::launcher(TaskLauncher launcher) {
    std::lock_guard<std::mutex> launch_lock(launch_mutex_);
    launcher_ = std::move(launcher);
}

void TransferTask::launch() {
    std::lock_guard<std::mutex> launch_lock(launch_mutex_);
    if (launcher_) {
        launcher_();
        return;
    }

    // The previous run has already cleared active_, so this join is short
    if (thread_.joinable()) {
        thread_.join();
    }
    thread_ = std::jthread([this] { run(); });
}

//=============================================================================
// Controls
//=============================================================================

std::error_code TransferTask::start() noexcept {
    if (auto ec = validate(ref_)) {
        return ec;
    }
    if (!fetcher_) {
        return make_error_code(TransferErrc::invalid_state);
    }

    bool need_launch = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_ != Action::none) {
            return {};  // already scheduled
        }

        held_ = false;
        if (state_ == TransferState::paused) {
            pending_ = Action::resume;
        } else if (state_ == TransferState::pending || is_terminal(state_)) {
            pending_ = Action::start;
        } else {
            return {};  // probing or downloading
        }

        if (!active_) {
            active_ = true;
            need_launch = true;
        }
    }

    if (need_launch) {
        launch();
    }
    return {};
}

void TransferTask::pause() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    // A queued resume is withdrawn; the task stays paused
    if (pending_ == Action::resume) {
        pending_ = Action::none;
    }

    // A queued start is held: run() finds nothing to do and the state is unchanged
    if (pending_ == Action::start) {
        pending_ = Action::none;
        held_ = true;
    }

    if (running_ && (state_ == TransferState::probing || state_ == TransferState::downloading)) {
        stop_.request(StopReason::pause);
    }
}

void TransferTask::resume() noexcept {
    bool need_launch = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_ != Action::none) {
            return;
        }

        if (held_) {
            held_ = false;
            pending_ = Action::start;
        } else if (state_ == TransferState::paused) {
            pending_ = Action::resume;
        } else {
            return;
        }
        if (!active_) {
            active_ = true;
            need_launch = true;
        }
    }

    if (need_launch) {
        launch();
    }
}

void TransferTask::cancel(bool delete_partial) noexcept {
    bool immediate = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = Action::none;
        held_ = false;
        if (is_terminal(state_)) {
            return;
        }

        // Nothing in flight: pending or paused tasks settle right here
        if (!running_ || state_ == TransferState::paused) {
            state_ = TransferState::cancelled;
            error_ = make_error_code(TransferErrc::cancelled);
            reason_ = "cancelled";
            rate_bps_.store(0, std::memory_order_relaxed);
            immediate = true;
        } else {
            delete_partial_ = delete_partial;
            stop_.request(StopReason::cancel);
        }
    }

    if (immediate) {
        if (delete_partial) {
            discard_partial();
        }
        logger()->debug("{}: -> cancelled", ref_.destination_path);
        emit(true);
    }
}

//=============================================================================
// Run loop
//=============================================================================

void TransferTask::run() noexcept {
    for (;;) {
        TransferState entered;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_ == Action::none) {
                running_ = false;
                active_ = false;
                idle_cv_.notify_all();
                return;
            }

            auto action = std::exchange(pending_, Action::none);
            running_ = true;
            stop_.reset();
            delete_partial_ = config_.delete_partial_on_cancel;

            // Resuming goes straight back to the byte loop once the size is known
            entered = (action == Action::resume && probed_ && total_)
                ? TransferState::downloading
                : TransferState::probing;

            if (!can_transition(state_, entered)) {
                logger()->error("{}: illegal transition {} -> {}", ref_.destination_path,
                                to_string(state_), to_string(entered));
                continue;
            }

            if (is_terminal(state_)) {
                bytes_done_.store(0, std::memory_order_relaxed);
                total_ = ref_.expected_size;
            }
            if (entered == TransferState::probing) {
                probed_ = false;
            }
            state_ = entered;
            error_.clear();
            reason_.clear();
        }

        logger()->debug("{}: -> {}", ref_.destination_path, to_string(entered));
        emit(true);

        if (entered == TransferState::probing && !probe()) {
            continue;
        }
        download();
    }
}

bool TransferTask::probe() noexcept {
    std::uint32_t failures = 0;

    for (;;) {
        if (stop_.stop_requested()) {
            settle_stopped(bytes_done_.load(std::memory_order_relaxed));
            return false;
        }

        auto info = fetcher_->probe(ref_.source_url, stop_);
        if (info) {
            if (info->total_size && ref_.expected_size && *info->total_size != *ref_.expected_size) {
                logger()->warn("{}: server reports {} bytes, listing said {}",
                               ref_.destination_path, *info->total_size, *ref_.expected_size);
            }

            resumable_ = info->accepts_ranges;
            std::lock_guard<std::mutex> lock(mutex_);
            probed_ = true;
            total_ = info->total_size ? info->total_size : ref_.expected_size;
            return true;
        }

        auto kind = classify(info.error());
        if (kind == ErrorKind::cancellation || stop_.stop_requested()) {
            settle_stopped(bytes_done_.load(std::memory_order_relaxed));
            return false;
        }

        if (kind == ErrorKind::transient_network && failures < config_.retry_limit) {
            ++failures;
            auto delay = config_.backoff(failures);
            logger()->warn("{}: probe failed ({}), retry {}/{} in {} ms", ref_.destination_path,
                           info.error().message(), failures, config_.retry_limit, delay.count());
            if (stop_.wait_for(delay)) {
                settle_stopped(bytes_done_.load(std::memory_order_relaxed));
                return false;
            }
            continue;
        }

        fail(make_error_code(TransferErrc::probe_failed),
             fmt::format("probe failed: {}", info.error().message()));
        return false;
    }
}

void TransferTask::download() noexcept {
    const auto& dest = ref_.destination_path;

    std::optional<std::uint64_t> total;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total = total_;
    }

    auto existing = disk::file_size(dest);
    if (!existing && existing.error() != make_error_code(disk::DiskErrc::file_not_found)) {
        fail(existing.error(), fmt::format("cannot inspect {}: {}", dest, existing.error().message()));
        return;
    }
    auto record = ResumeLedger::load(dest);

    if (existing && !record && total && *existing == *total) {
        logger()->info("{} already complete ({} bytes)", dest, *total);
        complete(*total, "already complete");
        return;
    }

    std::uint64_t offset = 0;
    if (resumable_ && existing) {
        bool same_transfer = !record ||
            (record->source_url == ref_.source_url &&
             (!record->expected_size || !total || *record->expected_size == *total));

        if (!same_transfer) {
            logger()->info("{}: resume record belongs to another transfer, starting over", dest);
        } else if (total && *existing > *total) {
            logger()->warn("{}: file holds {} bytes, more than the expected {}; starting over",
                           dest, *existing, *total);
        } else {
            auto reconciled = ResumeLedger::reconcile(dest);
            if (!reconciled) {
                fail(reconciled.error(), fmt::format("cannot read resume state for {}: {}",
                                                     dest, reconciled.error().message()));
                return;
            }
            offset = *reconciled;
        }
    }

    if (offset > 0 && total && offset == *total) {
        logger()->info("{} already complete ({} bytes)", dest, offset);
        complete(offset, "already complete");
        return;
    }

    if (offset > 0) {
        logger()->info("resuming {} at byte {}", dest, offset);
    }
    bytes_done_.store(offset, std::memory_order_relaxed);

    if (state() == TransferState::probing && !transition(TransferState::downloading)) {
        return;
    }

    std::uint32_t failures = 0;
    for (;;) {
        if (stop_.stop_requested()) {
            settle_stopped(offset);
            return;
        }

        disk::FileWriter writer;
        if (auto ec = writer.open(dest, offset)) {
            fail(ec, fmt::format("cannot open {}: {}", dest, ec.message()));
            return;
        }
        if (resumable_) {
            save_record(offset);
        }

        const auto attempt_start = offset;
        auto last_emit = std::chrono::steady_clock::now();
        auto last_save = last_emit;
        rate_.reset(last_emit);

        auto on_chunk = [&](std::uint64_t bytes) {
            auto done = bytes_done_.fetch_add(bytes, std::memory_order_relaxed) + bytes;
            auto now = std::chrono::steady_clock::now();
            rate_.add(bytes, now);
            rate_bps_.store(rate_.rate_bps(), std::memory_order_relaxed);

            if (now - last_emit >= config_.progress_interval) {
                last_emit = now;
                emit(false);
            }
            if (resumable_ && now - last_save >= config_.ledger_interval) {
                last_save = now;
                save_record(done);
            }
        };

        auto outcome = fetcher_->fetch(ref_.source_url, offset, writer, stop_, on_chunk);
        offset = writer.position();
        bytes_done_.store(offset, std::memory_order_relaxed);

        if (auto ec = writer.close()) {
            fail(ec, fmt::format("cannot write {}: {}", dest, ec.message()));
            return;
        }

        if (outcome.status == FetchStatus::cancelled) {
            settle_stopped(offset);
            return;
        }

        auto ec = outcome.error;
        auto why = outcome.reason;
        if (outcome.status == FetchStatus::completed) {
            if (total && offset > *total) {
                fail(make_error_code(TransferErrc::size_mismatch),
                     fmt::format("received {} bytes, expected {}", offset, *total));
                return;
            }
            if (!total || offset == *total) {
                complete(offset);
                return;
            }
            ec = make_error_code(TransferErrc::connection_lost);
            why = fmt::format("connection closed at byte {} of {}", offset, *total);
        }

        switch (classify(ec)) {
            case ErrorKind::server_rejected_range:
                if (attempt_start == 0) {
                    fail(ec, why);
                    return;
                }
                // Never append a full re-send to existing bytes
                logger()->warn("{}: {}; restarting from byte 0", dest, why);
                resumable_ = false;
                if (auto rm = ResumeLedger::remove(dest)) {
                    logger()->error("{}: removing resume record: {}", dest, rm.message());
                }
                offset = 0;
                bytes_done_.store(0, std::memory_order_relaxed);
                continue;

            case ErrorKind::transient_network: {
                if (offset > attempt_start) {
                    failures = 0;
                }
                if (resumable_) {
                    save_record(offset);
                }
                if (++failures > config_.retry_limit) {
                    fail(make_error_code(TransferErrc::retries_exhausted),
                         fmt::format("{} (gave up after {} retries)", why, config_.retry_limit));
                    return;
                }
                if (!resumable_) {
                    offset = 0;
                    bytes_done_.store(0, std::memory_order_relaxed);
                }

                auto delay = config_.backoff(failures);
                logger()->warn("{}: {}; retry {}/{} in {} ms", dest, why, failures,
                               config_.retry_limit, delay.count());
                rate_bps_.store(0, std::memory_order_relaxed);
                if (stop_.wait_for(delay)) {
                    settle_stopped(offset);
                    return;
                }
                continue;
            }

            case ErrorKind::cancellation:
                settle_stopped(offset);
                return;

            default:
                if (resumable_ && offset > 0) {
                    save_record(offset);
                }
                fail(ec, why);
                return;
        }
    }
}

//=============================================================================
// Settling
//=============================================================================

bool TransferTask::transition(TransferState to, std::error_code ec, std::string why) noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!can_transition(state_, to)) {
            logger()->error("{}: illegal transition {} -> {}", ref_.destination_path,
                            to_string(state_), to_string(to));
            return false;
        }
        state_ = to;
        if (ec) {
            error_ = ec;
        }
        if (!why.empty()) {
            reason_ = std::move(why);
        }
    }

    logger()->debug("{}: -> {}", ref_.destination_path, to_string(to));
    emit(true);
    return true;
}

void TransferTask::complete(std::uint64_t bytes, std::string note) noexcept {
    if (auto ec = ResumeLedger::remove(ref_.destination_path)) {
        logger()->warn("{}: removing resume record: {}", ref_.destination_path, ec.message());
    }
    bytes_done_.store(bytes, std::memory_order_relaxed);
    rate_bps_.store(0, std::memory_order_relaxed);
    if (transition(TransferState::completed, {}, std::move(note))) {
        logger()->info("{} complete ({} bytes)", ref_.destination_path, bytes);
    }
}

void TransferTask::fail(std::error_code ec, std::string why) noexcept {
    rate_bps_.store(0, std::memory_order_relaxed);
    logger()->error("{} failed: {}", ref_.destination_path, why);
    transition(TransferState::failed, ec, std::move(why));
}

void TransferTask::settle_stopped(std::uint64_t offset) noexcept {
    rate_bps_.store(0, std::memory_order_relaxed);

    if (stop_.reason() == StopReason::cancel) {
        bool discard = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            discard = delete_partial_;
        }
        if (discard) {
            discard_partial();
        } else if (resumable_ && offset > 0) {
            save_record(offset);
        }
        transition(TransferState::cancelled, make_error_code(TransferErrc::cancelled), "cancelled");
        return;
    }

    if (resumable_ && offset > 0) {
        save_record(offset);
    }
    transition(TransferState::paused);
}

void TransferTask::save_record(std::uint64_t bytes) noexcept {
    ResumeRecord record;
    record.destination_path = ref_.destination_path;
    record.source_url = ref_.source_url;
    record.bytes_written = bytes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record.expected_size = total_;
    }

    if (auto ec = ResumeLedger::save(record)) {
        logger()->warn("{}: saving resume record: {}", ref_.destination_path, ec.message());
    }
}

void TransferTask::discard_partial() noexcept {
    if (auto ec = disk::remove_file(ref_.destination_path)) {
        logger()->error("{}: removing partial file: {}", ref_.destination_path, ec.message());
    }
    if (auto ec = ResumeLedger::remove(ref_.destination_path)) {
        logger()->error("{}: removing resume record: {}", ref_.destination_path, ec.message());
    }
}

void TransferTask::emit(bool state_change) noexcept {
    EventCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = callback_;
    }
    if (!cb) return;

    try {
        auto p = progress();

        ProgressEvent event;
        event.scope = EventScope::task;
        event.destination = ref_.destination_path;
        event.state_change = state_change;
        event.bytes_done = p.bytes_done;
        event.bytes_total = p.bytes_total;
        event.rate_bps = p.rate_bps;
        event.eta_seconds = p.eta_seconds;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            event.state = state_;
            event.reason = reason_;
        }
        cb(event);
    } catch (const std::exception& e) {
        logger()->error("{}: progress callback threw: {}", ref_.destination_path, e.what());
    }
}

//=============================================================================
// Queries
//=============================================================================

void TransferTask::wait_idle() const {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return !active_; });
}

bool TransferTask::wait_idle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return !active_; });
}

TransferState TransferTask::state() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

TransferProgress TransferTask::progress() const noexcept {
    TransferProgress p;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        p.bytes_total = total_;
    }
    p.bytes_done = bytes_done_.load(std::memory_order_relaxed);
    if (p.bytes_total) {
        p.bytes_done = std::min(p.bytes_done, *p.bytes_total);
    }
    p.rate_bps = rate_bps_.load(std::memory_order_relaxed);
    p.eta_seconds = estimate_eta(p.bytes_done, p.bytes_total, p.rate_bps);
    p.last_update = std::chrono::steady_clock::now();
    return p;
}

std::string TransferTask::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

std::error_code TransferTask::error() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

bool TransferTask::active() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

bool TransferTask::running() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

} // namespace haul::core
