#include "ProbeLimiter.hpp"
#include <algorithm>
#include <chrono>

namespace EmojiKitchen {

ProbeLimiter::ProbeLimiter(size_t max_in_flight) : max_in_flight_(std::max<size_t>(1, max_in_flight)) {}

bool ProbeLimiter::Acquire(const std::atomic<bool>* cancelled) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto is_cancelled = [cancelled] { return cancelled && cancelled->load(); };
    // Cancellation is flagged by other threads without touching this mutex, so poll.
    while (in_flight_ >= max_in_flight_) {
        if (is_cancelled()) return false;
        cv_.wait_for(lock, std::chrono::milliseconds(50));
    }
    if (is_cancelled()) return false;
    ++in_flight_;
    peak_ = std::max(peak_, in_flight_);
    return true;
}

void ProbeLimiter::Release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ > 0) --in_flight_;
    }
    cv_.notify_all();
}

size_t ProbeLimiter::InFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

size_t ProbeLimiter::PeakInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

}
