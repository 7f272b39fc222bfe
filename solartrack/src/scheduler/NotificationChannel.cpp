/**
 * @file NotificationChannel.cpp
 * @brief Implementation of NotificationChannel
 */

#include "solartrack/scheduler/NotificationChannel.hpp"
#include <exception>
#include <iostream>

namespace solartrack::scheduler {

void NotificationChannel::post(Callback callback) {
    if (!callback) return;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(callback));
    }
    condition_.notify_one();
}

std::size_t NotificationChannel::runPending() {
    std::lock_guard<std::mutex> drain_lock(drain_mutex_);

    std::deque<Callback> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        batch.swap(queue_);
    }

    for (auto& callback : batch) {
        try {
            callback();
        } catch (const std::exception& e) {
            std::cerr << "[NotificationChannel] Error: callback threw: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[NotificationChannel] Error: callback threw a non-standard exception\n";
        }
    }
    return batch.size();
}

std::size_t NotificationChannel::waitAndRunPending(std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        condition_.wait_for(lock, timeout, [this] { return !queue_.empty(); });
    }
    return runPending();
}

std::size_t NotificationChannel::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

} // namespace solartrack::scheduler
