#include "JobScheduler.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>

namespace EmojiKitchen {

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

            if (next_job.execution_time <= now) {
                ScheduledJob job_to_run = std::move(next_job);
                jobs.pop_back();
                // Unlock before executing so other threads can Cancel/Schedule
                lock.unlock();
                if (!job_to_run.cancelled) {
                    try {
                        thread_pool.enqueue(job_to_run.job);
                    } catch (const std::exception& e) {
                        Logger::Log(LogLevel::Warn, "Dropping job " + job_to_run.name + ": " + e.what());
                    }
                }
                lock.lock();
            } else {
                // Woken early by Schedule/Cancel/stop; the loop re-evaluates the earliest job.
                // Copy the deadline: Schedule may reallocate jobs while we wait.
                const auto wake_at = next_job.execution_time;
                cv.wait_until(lock, wake_at);
            }
        }
    }
}

void JobScheduler::Schedule(const std::string& name, int delay_seconds, Job job) {
    {
        std::unique_lock<std::mutex> lock(jobs_mutex);

        auto it = std::find_if(jobs.begin(), jobs.end(), [&name](const ScheduledJob& j) {
            return j.name == name;
        });

        if (it != jobs.end()) {
            it->execution_time = std::chrono::steady_clock::now() + std::chrono::seconds(delay_seconds);
            it->job = std::move(job);
            it->cancelled = false; // In case it was cancelled before
            Logger::Log(LogLevel::Debug, "Rescheduled pending job: " + name);
        } else {
            jobs.push_back({
                name,
                std::chrono::steady_clock::now() + std::chrono::seconds(delay_seconds),
                std::move(job),
                false
            });
        }
    }
    cv.notify_one();
}

void JobScheduler::Cancel(const std::string& name) {
    std::unique_lock<std::mutex> lock(jobs_mutex);
    bool any = false;
    for (auto& job : jobs) {
        if (job.name == name) {
            job.cancelled = true;
            any = true;
        }
    }
    if (any) {
        Logger::Log(LogLevel::Info, "Cancelled job: " + name);
    }
    cv.notify_all();
}

size_t JobScheduler::PendingCount() {
    std::unique_lock<std::mutex> lock(jobs_mutex);
    return static_cast<size_t>(std::count_if(jobs.begin(), jobs.end(), [](const ScheduledJob& j) { return !j.cancelled; }));
}

}
