#include "KeyLocks.hpp"

namespace EmojiKitchen {

KeyLocks::KeyLocks(size_t max_entries) : max_entries_(max_entries == 0 ? 1 : max_entries) {}

std::shared_ptr<std::mutex> KeyLocks::Acquire(const std::string& key) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = index_.find(key);
    if (it != index_.end()) {
        lru_.splice(lru_.begin(), lru_, it->second);
        return it->second->mutex;
    }

    // Evict before inserting so the requested key always survives.
    // use_count() == 1 means only the map references it.
    auto victim = lru_.end();
    while (index_.size() >= max_entries_ && victim != lru_.begin()) {
        --victim;
        if (victim->mutex.use_count() == 1) {
            index_.erase(victim->key);
            victim = lru_.erase(victim);
        }
    }

    lru_.push_front({key, std::make_shared<std::mutex>()});
    index_[key] = lru_.begin();
    return lru_.front().mutex;
}

size_t KeyLocks::Size() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return index_.size();
}

}
