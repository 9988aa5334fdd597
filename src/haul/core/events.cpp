// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/events.hpp>
#include <haul/core/log.hpp>
#include <algorithm>

namespace haul::core {

//=============================================================================
// EventChannel
//=============================================================================

EventChannel::EventChannel(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void EventChannel::publish(ProgressEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_) {
            auto oldest = std::find_if(queue_.begin(), queue_.end(),
                                       [](const ProgressEvent& e) { return !e.state_change; });
            if (oldest != queue_.end()) {
                queue_.erase(oldest);
                dropped_.fetch_add(1, std::memory_order_relaxed);
            } else if (!event.state_change) {
                // Queue holds only state changes; the new progress sample goes
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return;
            }
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<ProgressEvent> EventChannel::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) return std::nullopt;
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<ProgressEvent> EventChannel::pop(std::stop_token stoken) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait(lock, stoken, [this] { return !queue_.empty(); })) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

//=============================================================================
// EventPump
//=============================================================================

EventPump::EventPump(std::shared_ptr<EventChannel> channel, EventCallback callback)
    : channel_(std::move(channel))
    , callback_(std::move(callback))
    , thread_([this](std::stop_token stoken) { loop(stoken); }) {}

EventPump::~EventPump() {
    stop();
}

void EventPump::stop() {
    if (!thread_.joinable()) return;
    thread_.request_stop();
    thread_.join();

    // Events published before stop() still reach the reporter
    while (auto event = channel_->try_pop()) {
        deliver(*event);
    }
}

void EventPump::loop(std::stop_token stoken) noexcept {
    while (!stoken.stop_requested()) {
        try {
            auto event = channel_->pop(stoken);
            if (event) {
                deliver(*event);
            }
        } catch (const std::exception& e) {
            logger()->error("event pump: {}", e.what());
        }
    }
}

void EventPump::deliver(const ProgressEvent& event) noexcept {
    if (!callback_) return;
    try {
        callback_(event);
    } catch (const std::exception& e) {
        logger()->error("progress callback threw: {}", e.what());
    }
}

} // namespace haul::core
