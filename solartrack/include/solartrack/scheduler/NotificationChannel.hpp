/**
 * @file NotificationChannel.hpp
 * @brief FIFO of callbacks handed from worker threads to the presentation thread
 * @author SolarTrack Team
 *
 * Any thread may post. One consumer drains the queue with runPending() or
 * waitAndRunPending(); callbacks run on the draining thread, in posting
 * order, never concurrently with each other.
 */

#ifndef SOLARTRACK_SCHEDULER_NOTIFICATION_CHANNEL_HPP
#define SOLARTRACK_SCHEDULER_NOTIFICATION_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace solartrack::scheduler {

class NotificationChannel {
public:
    using Callback = std::function<void()>;

    NotificationChannel() = default;
    NotificationChannel(const NotificationChannel&) = delete;
    NotificationChannel& operator=(const NotificationChannel&) = delete;

    /// Enqueue; never blocks on the consumer
    void post(Callback callback);

    /**
     * @brief Run every callback queued at the time of the call
     * @return Number of callbacks run
     */
    std::size_t runPending();

    /// Wait up to timeout for at least one callback, then runPending()
    std::size_t waitAndRunPending(std::chrono::milliseconds timeout);

    std::size_t pending() const;

private:
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::deque<Callback> queue_;
    std::mutex drain_mutex_;   // serialises consumers
};

} // namespace solartrack::scheduler

#endif // SOLARTRACK_SCHEDULER_NOTIFICATION_CHANNEL_HPP
