#pragma once
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace EmojiKitchen {
    // One mutex per PairKey so concurrent requests for the same pair probe the CDN once.
    // The map keeps at most max_entries keys; least recently used keys nobody holds are dropped first.
    class KeyLocks {
    public:
        explicit KeyLocks(size_t max_entries = 1024);

        std::shared_ptr<std::mutex> Acquire(const std::string& key);
        size_t Size() const;

    private:
        struct Entry {
            std::string key;
            std::shared_ptr<std::mutex> mutex;
        };

        size_t max_entries_;
        std::list<Entry> lru_;
        std::unordered_map<std::string, std::list<Entry>::iterator> index_;
        mutable std::mutex map_mutex_;
    };
}
