/**
 * @file TaskScheduler.cpp
 * @brief Implementation of TaskScheduler
 */

#include "solartrack/scheduler/TaskScheduler.hpp"
#include <exception>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace solartrack::scheduler {

std::string jobStatusName(JobStatus status) {
    switch (status) {
        case JobStatus::Started: return "started";
        case JobStatus::Progress: return "progress";
        case JobStatus::Succeeded: return "succeeded";
        case JobStatus::Failed: return "failed";
    }
    return "unknown";
}

void JobContext::setStatus(const std::string& message) {
    scheduler_.notify(id_, name_, JobStatus::Progress, message);
}

void JobContext::deliver(std::function<void()> fn) {
    scheduler_.channel_.post(std::move(fn));
}

TaskScheduler::TaskScheduler(NotificationChannel& channel, Listener listener, bool verbose)
    : channel_(channel), listener_(std::move(listener)), verbose_(verbose) {}

TaskScheduler::~TaskScheduler() {
    waitIdle();
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) worker_.join();
}

SubmitResult TaskScheduler::submit(const std::string& name, Work work) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        if (verbose_) {
            std::cout << "[TaskScheduler] Rejected '" << name << "': a job is already running\n";
        }
        return SubmitResult::RejectedBusy;
    }

    const std::uint64_t id = ++last_id_;

    std::lock_guard<std::mutex> lock(mutex_);
    // Previous worker has released the slot; only its thread exit remains
    if (worker_.joinable()) worker_.join();

    try {
        worker_ = std::thread([this, id, name, work = std::move(work)]() { runJob(id, name, work); });
    } catch (const std::system_error&) {
        running_.store(false);
        idle_cv_.notify_all();
        throw;
    }

    if (verbose_) {
        std::cout << "[TaskScheduler] Accepted job " << id << " '" << name << "'\n";
    }
    return SubmitResult::Accepted;
}

void TaskScheduler::runJob(std::uint64_t id, const std::string& name, const Work& work) {
    notify(id, name, JobStatus::Started, "");

    JobContext context(*this, id, name);
    try {
        if (!work) throw std::invalid_argument("job has no work");
        work(context);
        notify(id, name, JobStatus::Succeeded, "");
    } catch (const std::exception& e) {
        notify(id, name, JobStatus::Failed, e.what());
    } catch (...) {
        notify(id, name, JobStatus::Failed, "non-standard exception");
    }

    release();
}

void TaskScheduler::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    idle_cv_.notify_all();
}

void TaskScheduler::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return !running_.load(); });
}

void TaskScheduler::notify(std::uint64_t id, const std::string& name, JobStatus status, const std::string& message) {
    JobNotification n{id, name, status, message};

    if (status == JobStatus::Failed) {
        std::cerr << "[TaskScheduler] Job " << id << " '" << name << "' failed: " << message << "\n";
    } else if (verbose_) {
        std::cout << "[TaskScheduler] Job " << id << " '" << name << "' " << jobStatusName(status);
        if (!message.empty()) std::cout << ": " << message;
        std::cout << "\n";
    }

    if (listener_) {
        channel_.post([listener = listener_, n]() { listener(n); });
    }
}

} // namespace solartrack::scheduler
