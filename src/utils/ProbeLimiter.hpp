#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace EmojiKitchen {
    // Counting semaphore shared by every CDN probe in the process.
    // A slot is taken before a request is dispatched and given back from its completion callback.
    class ProbeLimiter {
    public:
        explicit ProbeLimiter(size_t max_in_flight);

        ProbeLimiter(const ProbeLimiter&) = delete;
        ProbeLimiter& operator=(const ProbeLimiter&) = delete;

        // Blocks until a slot is free. Returns false without taking a slot once *cancelled becomes true.
        bool Acquire(const std::atomic<bool>* cancelled = nullptr);
        void Release();

        size_t InFlight() const;
        size_t PeakInFlight() const;

    private:
        const size_t max_in_flight_;
        size_t in_flight_ = 0;
        size_t peak_ = 0;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
    };
}
