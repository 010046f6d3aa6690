#include "JobScheduler.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace Cadenza {

JobScheduler::JobScheduler(ThreadPool& pool) : thread_pool(pool), stop_(false) {
    scheduler_thread = std::thread(&JobScheduler::Run, this);
}

JobScheduler::~JobScheduler() {
    {
        std::unique_lock<std::mutex> lock(jobs_mutex);
        stop_ = true;
    }
    cv.notify_all();
    if (scheduler_thread.joinable()) {
        scheduler_thread.join();
    }
}

void JobScheduler::Run() {
    std::unique_lock<std::mutex> lock(jobs_mutex);
    while (!stop_) {
        if (jobs.empty()) {
            cv.wait(lock, [this] { return stop_ || !jobs.empty(); });
            if (stop_) break;
        } else {
            // Sort to select the job with the earliest execution time
            std::sort(jobs.begin(), jobs.end(), [](const ScheduledJob& a, const ScheduledJob& b) {
                return a.execution_time > b.execution_time; // back() will be the earliest job
            });

            auto now = std::chrono::steady_clock::now();
            ScheduledJob& next_job = jobs.back();

            if (next_job.cancelled) {
                jobs.pop_back();
                continue;
            }

            if (next_job.execution_time <= now) {
                ScheduledJob job_to_run = std::move(next_job);
                jobs.pop_back();
                if (job_to_run.period.count() > 0) {
                    jobs.push_back({job_to_run.id, now + job_to_run.period, job_to_run.period, job_to_run.job, false});
                }
                // Unlock before dispatching so other threads can Cancel/Schedule
                lock.unlock();
                std::string id = job_to_run.id;
                Job job = std::move(job_to_run.job);
                try {
                    thread_pool.enqueue([id, job]() {
                        try {
                            job();
                        } catch (const std::exception& e) {
                            Logger::Log(LogLevel::Error, "scheduler", "Job " + id + " failed: " + e.what());
                        }
                    });
                } catch (const std::runtime_error& e) {
                    Logger::Log(LogLevel::Warn, "scheduler", "Could not dispatch job " + id + ": " + e.what());
                }
                lock.lock();
            } else {
                // Woken early by Schedule/Cancel/stop; the loop re-evaluates the earliest job
                auto until = next_job.execution_time;
                cv.wait_until(lock, until);
            }
        }
    }
}

void JobScheduler::Upsert(const std::string& id, std::chrono::milliseconds delay, std::chrono::milliseconds period, Job job) {
    {
        std::unique_lock<std::mutex> lock(jobs_mutex);
        auto execution_time = std::chrono::steady_clock::now() + delay;

        auto it = std::find_if(jobs.begin(), jobs.end(), [&id](const ScheduledJob& j) {
            return j.id == id && !j.cancelled;
        });

        if (it != jobs.end()) {
            it->execution_time = execution_time;
            it->period = period;
            it->job = std::move(job);
            Logger::Log(LogLevel::Debug, "scheduler", "Updating existing job " + id);
        } else {
            jobs.push_back({id, execution_time, period, std::move(job), false});
        }
    }
    cv.notify_one();
}

void JobScheduler::Schedule(const std::string& id, std::chrono::milliseconds delay, Job job) {
    Upsert(id, delay, std::chrono::milliseconds(0), std::move(job));
}

void JobScheduler::SchedulePeriodic(const std::string& id, std::chrono::milliseconds interval, Job job) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("Periodic job " + id + " needs a positive interval");
    }
    Upsert(id, interval, interval, std::move(job));
}

bool JobScheduler::Cancel(const std::string& id) {
    std::unique_lock<std::mutex> lock(jobs_mutex);
    bool any = false;
    for (auto& job : jobs) {
        if (job.id == id && !job.cancelled) {
            job.cancelled = true;
            any = true;
        }
    }
    if (any) {
        Logger::Log(LogLevel::Debug, "scheduler", "Cancelled job " + id);
    }
    cv.notify_all();
    return any;
}

bool JobScheduler::IsScheduled(const std::string& id) {
    std::unique_lock<std::mutex> lock(jobs_mutex);
    return std::any_of(jobs.begin(), jobs.end(), [&id](const ScheduledJob& j) {
        return j.id == id && !j.cancelled;
    });
}

}
