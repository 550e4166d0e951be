#include "ProbeTracker.hpp"
#include <algorithm>

namespace EmojiKitchen {

ProbeTracker::ProbeTracker(size_t max_size, int expire_days, WallClock clock)
    : max_size_(std::max<size_t>(1, max_size)),
      ttl_(24 * std::max(0, expire_days)),
      clock_(clock ? std::move(clock) : SystemWallClock()) {}

std::set<std::string> ProbeTracker::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = progress_map_.find(key);

    if (it == progress_map_.end()) {
        return {};
    }

    if (clock_() >= it->second->expiry_time) {
        progress_list_.erase(it->second);
        progress_map_.erase(it);
        return {};
    }

    progress_list_.splice(progress_list_.begin(), progress_list_, it->second);
    return it->second->tried_dates;
}

void ProbeTracker::Record(const std::string& key, const std::set<std::string>& tried_dates) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = progress_map_.find(key);

    // Progress keeps the expiry of the first attempt, so a key cannot stay partially explored forever.
    auto expiry_time = clock_() + ttl_;
    if (it != progress_map_.end()) {
        if (clock_() < it->second->expiry_time) {
            expiry_time = it->second->expiry_time;
        }
        progress_list_.erase(it->second);
        progress_map_.erase(it);
    }

    if (progress_map_.size() >= max_size_ && !progress_list_.empty()) {
        const auto& lru = progress_list_.back();
        progress_map_.erase(lru.key);
        progress_list_.pop_back();
    }

    progress_list_.push_front({key, tried_dates, expiry_time});
    progress_map_[key] = progress_list_.begin();
}

void ProbeTracker::Clear(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = progress_map_.find(key);
    if (it == progress_map_.end()) return;
    progress_list_.erase(it->second);
    progress_map_.erase(it);
}

size_t ProbeTracker::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_map_.size();
}

}
