#pragma once
#include <functional>
#include <string>
#include <vector>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <chrono>
#include "../utils/ThreadPool.hpp"

namespace Cadenza {
    // Delayed and periodic jobs, dispatched onto the thread pool when due.
    // Jobs are identified by name; scheduling an existing name replaces it.
    class JobScheduler {
    public:
        using Job = std::function<void()>;

        explicit JobScheduler(ThreadPool& pool);
        ~JobScheduler();

        void Schedule(const std::string& id, std::chrono::milliseconds delay, Job job);
        // Runs `job` every `interval` (first run after one interval) until cancelled.
        void SchedulePeriodic(const std::string& id, std::chrono::milliseconds interval, Job job);
        bool Cancel(const std::string& id);
        bool IsScheduled(const std::string& id);

    private:
        void Run();
        void Upsert(const std::string& id, std::chrono::milliseconds delay, std::chrono::milliseconds period, Job job);

        struct ScheduledJob {
            std::string id;
            std::chrono::steady_clock::time_point execution_time;
            std::chrono::milliseconds period{0}; // zero for one-shot jobs
            Job job;
            bool cancelled = false;
        };

        ThreadPool& thread_pool;
        std::vector<ScheduledJob> jobs;
        std::mutex jobs_mutex;
        std::condition_variable cv;
        std::thread scheduler_thread;
        bool stop_ = false;
    };
}
