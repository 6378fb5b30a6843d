#include "Scheduler.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace Fanout {

Scheduler::Scheduler(ThreadPool& pool) : thread_pool(pool), stop_(false) {
    scheduler_thread = std::thread(&Scheduler::Run, this);
}

Scheduler::~Scheduler() {
    size_t dropped = 0;
    {
        std::unique_lock<std::mutex> lock(jobs_mutex);
        stop_ = true;
        dropped = jobs.size();
        jobs.clear();
    }
    cv.notify_all();
    if (scheduler_thread.joinable()) {
        scheduler_thread.join();
    }
    if (dropped > 0) {
        Logger::Log(LogLevel::Debug, "scheduler", "Scheduler stopped with " + std::to_string(dropped) + " pending job(s) dropped");
    }
}

void Scheduler::Run() {
    std::unique_lock<std::mutex> lock(jobs_mutex);
    while (!stop_) {
        if (jobs.empty()) {
            cv.wait(lock, [this] { return stop_ || !jobs.empty(); });
            continue;
        }

        // Sort so that back() is the job with the earliest execution time
        std::sort(jobs.begin(), jobs.end(), [](const ScheduledJob& a, const ScheduledJob& b) {
            return a.execution_time > b.execution_time;
        });

        auto now = std::chrono::steady_clock::now();
        ScheduledJob& next_job = jobs.back();

        if (next_job.execution_time <= now) {
            Job to_run = next_job.job;
            if (next_job.interval.count() > 0) {
                next_job.execution_time = now + next_job.interval;
            } else {
                jobs.pop_back();
            }
            // Unlock while enqueueing so Schedule/Cancel are not held up
            lock.unlock();
            try {
                thread_pool.enqueue([job = std::move(to_run)]() {
                    try {
                        job();
                    } catch (const std::exception& e) {
                        Logger::Log(LogLevel::Error, "scheduler", "Scheduled job threw: " + std::string(e.what()));
                    }
                });
            } catch (const std::exception& e) {
                Logger::Log(LogLevel::Error, "scheduler", "Failed to dispatch scheduled job: " + std::string(e.what()));
            }
            lock.lock();
        } else {
            // A newly scheduled earlier job or Cancel() wakes us through cv
            auto wake_at = next_job.execution_time;
            cv.wait_until(lock, wake_at);
        }
    }
}

Scheduler::JobId Scheduler::Schedule(std::chrono::milliseconds delay, Job job) {
    JobId id = 0;
    {
        std::unique_lock<std::mutex> lock(jobs_mutex);
        if (stop_) {
            throw std::runtime_error("Schedule on stopped Scheduler");
        }
        id = next_id_++;
        jobs.push_back({id, std::chrono::steady_clock::now() + delay, std::chrono::milliseconds::zero(), std::move(job)});
    }
    cv.notify_one();
    return id;
}

Scheduler::JobId Scheduler::ScheduleEvery(std::chrono::milliseconds interval, Job job) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("ScheduleEvery interval must be positive");
    }
    JobId id = 0;
    {
        std::unique_lock<std::mutex> lock(jobs_mutex);
        if (stop_) {
            throw std::runtime_error("ScheduleEvery on stopped Scheduler");
        }
        id = next_id_++;
        jobs.push_back({id, std::chrono::steady_clock::now() + interval, interval, std::move(job)});
    }
    cv.notify_one();
    Logger::Log(LogLevel::Debug, "scheduler", "Scheduled periodic job #" + std::to_string(id) + " every " + std::to_string(interval.count()) + " ms");
    return id;
}

bool Scheduler::Cancel(JobId id) {
    bool removed = false;
    {
        std::unique_lock<std::mutex> lock(jobs_mutex);
        auto it = std::find_if(jobs.begin(), jobs.end(), [id](const ScheduledJob& j) { return j.id == id; });
        if (it != jobs.end()) {
            jobs.erase(it);
            removed = true;
        }
    }
    if (removed) cv.notify_all();
    return removed;
}

size_t Scheduler::Pending() const {
    std::lock_guard<std::mutex> lock(jobs_mutex);
    return jobs.size();
}

}
