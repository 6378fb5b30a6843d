#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include "../utils/ThreadPool.hpp"

namespace Fanout {
    // Delayed and periodic jobs, dispatched onto a ThreadPool. The timer thread
    // starts with the scheduler and stops with it; jobs still pending at
    // destruction are dropped.
    class Scheduler {
    public:
        using Job = std::function<void()>;
        using JobId = std::uint64_t;

        explicit Scheduler(ThreadPool& pool);
        ~Scheduler();

        Scheduler(const Scheduler&) = delete;
        Scheduler& operator=(const Scheduler&) = delete;

        JobId Schedule(std::chrono::milliseconds delay, Job job);
        JobId ScheduleEvery(std::chrono::milliseconds interval, Job job);

        // Returns false if the job already ran (one-shot) or never existed.
        bool Cancel(JobId id);

        size_t Pending() const;

    private:
        void Run();

        struct ScheduledJob {
            JobId id;
            std::chrono::steady_clock::time_point execution_time;
            std::chrono::milliseconds interval; // zero for one-shot jobs
            Job job;
        };

        ThreadPool& thread_pool;
        std::vector<ScheduledJob> jobs;
        mutable std::mutex jobs_mutex;
        std::condition_variable cv;
        std::thread scheduler_thread;
        JobId next_id_ = 1;
        bool stop_ = false;
    };
}
