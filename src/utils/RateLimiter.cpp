
#include "RateLimiter.hpp"

namespace EmojiKitchen {

RateLimiter::RateLimiter(double rate_per_second, double burst)
    : rate(rate_per_second), capacity(burst > 0.0 ? burst : rate_per_second) {
    allowance = capacity;
    last_check = std::chrono::steady_clock::now();
}

bool RateLimiter::TryAcquire() {
    if (rate <= 0.0) return true;

    std::lock_guard<std::mutex> lock(mutex);
    auto now = std::chrono::steady_clock::now();
    double time_passed = std::chrono::duration<double>(now - last_check).count();
    last_check = now;

    allowance += time_passed * rate;
    if (allowance > capacity) {
        allowance = capacity;
    }

    if (allowance >= 1.0) {
        allowance -= 1.0;
        return true;
    }
    return false;
}

}
