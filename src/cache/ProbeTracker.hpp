#pragma once
#include <string>
#include <set>
#include <list>
#include <unordered_map>
#include <chrono>
#include <mutex>
#include "CacheEntry.hpp"

namespace EmojiKitchen {
    // Remembers, per PairKey, the dates that already returned 404 in earlier budget-limited attempts,
    // so later attempts continue with the remaining candidates instead of starting over.
    // Bounded LRU; progress older than the not-found lifetime is forgotten.
    class ProbeTracker {
    public:
        ProbeTracker(size_t max_size, int expire_days, WallClock clock = SystemWallClock());
        std::set<std::string> Get(const std::string& key);
        void Record(const std::string& key, const std::set<std::string>& tried_dates);
        void Clear(const std::string& key);
        size_t Size() const;

    private:
        struct Progress {
            std::string key;
            std::set<std::string> tried_dates;
            std::chrono::system_clock::time_point expiry_time;
        };

        // NOTE: Expiry is enforced lazily within Get/Record. No explicit sweep is required.

        size_t max_size_;
        std::chrono::hours ttl_;
        WallClock clock_;
        std::list<Progress> progress_list_;
        std::unordered_map<std::string, decltype(progress_list_.begin())> progress_map_;
        mutable std::mutex mutex_;
    };
}
