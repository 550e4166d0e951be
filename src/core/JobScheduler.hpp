#pragma once
#include <functional>
#include <string>
#include <vector>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <chrono>
#include "../utils/ThreadPool.hpp"

namespace EmojiKitchen {
    // Runs named jobs on the thread pool after a delay. Scheduling a name that is already pending
    // replaces that job; periodic work reschedules itself from inside the job.
    class JobScheduler {
    public:
        using Job = std::function<void()>;

        explicit JobScheduler(ThreadPool& pool);
        ~JobScheduler();

        void Schedule(const std::string& name, int delay_seconds, Job job);
        void Cancel(const std::string& name);
        size_t PendingCount();

    private:
        void Run();

        struct ScheduledJob {
            std::string name;
            std::chrono::steady_clock::time_point execution_time;
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
