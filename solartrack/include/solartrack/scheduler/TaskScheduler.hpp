/**
 * @file TaskScheduler.hpp
 * @brief Single-flight background job runner
 * @author SolarTrack Team
 *
 * At most one job runs at a time. A submission while a job is running is
 * rejected immediately, never queued. Each accepted job runs on its own
 * worker thread and reports through a NotificationChannel:
 *
 *   Started, zero or more Progress, then exactly one Succeeded or Failed
 *
 * The terminal notification is enqueued before the slot is released, so
 * a listener always sees a job finish before the next one starts.
 */

#ifndef SOLARTRACK_SCHEDULER_TASK_SCHEDULER_HPP
#define SOLARTRACK_SCHEDULER_TASK_SCHEDULER_HPP

#include "solartrack/scheduler/NotificationChannel.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace solartrack::scheduler {

enum class JobStatus {
    Started,
    Progress,
    Succeeded,
    Failed
};

std::string jobStatusName(JobStatus status);

struct JobNotification {
    std::uint64_t job_id;
    std::string job_name;
    JobStatus status;
    std::string message;   ///< Progress text or failure reason
};

enum class SubmitResult {
    Accepted,
    RejectedBusy
};

class TaskScheduler;

/**
 * @brief Handle a running job uses to talk to the presentation thread
 */
class JobContext {
public:
    std::uint64_t id() const { return id_; }
    const std::string& name() const { return name_; }

    /// Post a Progress notification
    void setStatus(const std::string& message);

    /// Run fn on the presentation thread (result hand-off)
    void deliver(std::function<void()> fn);

private:
    friend class TaskScheduler;
    JobContext(TaskScheduler& scheduler, std::uint64_t id, std::string name)
        : scheduler_(scheduler), id_(id), name_(std::move(name)) {}

    TaskScheduler& scheduler_;
    std::uint64_t id_;
    std::string name_;
};

class TaskScheduler {
public:
    using Work = std::function<void(JobContext&)>;
    using Listener = std::function<void(const JobNotification&)>;

    /**
     * @param channel Where notifications and deliveries are posted; must outlive the scheduler
     * @param listener Invoked on the draining thread for every notification
     */
    explicit TaskScheduler(NotificationChannel& channel, Listener listener = nullptr, bool verbose = false);

    /// Waits for the running job (if any) and joins its thread
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    SubmitResult submit(const std::string& name, Work work);

    bool isRunning() const { return running_.load(); }

    /// Block until no job holds the slot
    void waitIdle();

    /// ID of the most recently accepted job (0 if none)
    std::uint64_t lastJobId() const { return last_id_.load(); }

private:
    friend class JobContext;

    NotificationChannel& channel_;
    Listener listener_;
    bool verbose_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> last_id_{0};

    std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::thread worker_;

    void notify(std::uint64_t id, const std::string& name, JobStatus status, const std::string& message);
    void runJob(std::uint64_t id, const std::string& name, const Work& work);
    void release();
};

} // namespace solartrack::scheduler

#endif // SOLARTRACK_SCHEDULER_TASK_SCHEDULER_HPP
