#pragma once
#include <chrono>
#include <mutex>
#include "../interfaces/IRateLimiter.hpp"

namespace EmojiKitchen {
    // Token bucket guarding how many resolutions incoming messages may start per second.
    // A non-positive rate disables limiting.
    class RateLimiter : public IRateLimiter {
    public:
        explicit RateLimiter(double rate_per_second, double burst = 0.0);
        bool TryAcquire() override;
    private:
        double rate;
        double capacity;
        double allowance;
        std::chrono::steady_clock::time_point last_check;
        std::mutex mutex;
    };
}
