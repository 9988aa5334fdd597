// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/config.hpp>
#include <haul/core/transfer_state.hpp>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace haul::core {

enum class EventScope : std::uint8_t {
    task,
    batch
};

// One telemetry message from the engine to a reporter
struct ProgressEvent {
    EventScope scope{EventScope::task};
    std::uint64_t job_id{0};
    std::size_t task_index{0};
    std::string destination;
    TransferState state{TransferState::pending};
    bool state_change{false};   // kept even when the channel is full
    std::uint64_t bytes_done{0};
    std::optional<std::uint64_t> bytes_total;
    std::uint64_t rate_bps{0};
    std::optional<std::uint64_t> eta_seconds;
    std::string reason;
};

using EventCallback = std::function<void(const ProgressEvent&)>;

// Bounded multi-producer queue. publish() never waits for the consumer: when
// full, the oldest progress event is dropped. State changes are never dropped.
class EventChannel {
public:
    explicit EventChannel(std::size_t capacity = EVENT_QUEUE_CAPACITY);

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void publish(ProgressEvent event);

    [[nodiscard]] std::optional<ProgressEvent> try_pop();

    // Block until an event arrives or `stoken` is triggered
    [[nodiscard]] std::optional<ProgressEvent> pop(std::stop_token stoken);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
    std::deque<ProgressEvent> queue_;
    std::atomic<std::size_t> dropped_{0};
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

// Drains a channel on its own thread into a callback
class EventPump {
public:
    EventPump(std::shared_ptr<EventChannel> channel, EventCallback callback);
    ~EventPump();

    EventPump(const EventPump&) = delete;
    EventPump& operator=(const EventPump&) = delete;

    // Deliver whatever is queued, then stop the thread. Safe to call twice.
    void stop();

private:
    void loop(std::stop_token stoken) noexcept;
    void deliver(const ProgressEvent& event) noexcept;

    std::shared_ptr<EventChannel> channel_;
    EventCallback callback_;
    std::jthread thread_;
};

} // namespace haul::core
