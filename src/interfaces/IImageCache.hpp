#pragma once
#include <optional>
#include <set>
#include <string>
#include "../cache/CacheEntry.hpp"

namespace EmojiKitchen {

class IImageCache {
public:
    virtual ~IImageCache() = default;
    // std::nullopt when nothing usable is stored (absent, expired or corrupt). Expired and corrupt
    // files are deleted, so callers must hold the key's lock.
    virtual std::optional<CacheEntry> Get(const std::string& key) = 0;
    // Read-only lookup of a cached image, safe without the key's lock.
    virtual std::optional<FoundEntry> PeekFound(const std::string& key) = 0;
    virtual bool PutFound(const std::string& key, const std::string& image, const std::string& source_date) = 0;
    virtual bool PutNotFound(const std::string& key, const std::set<std::string>& probed_dates) = 0;
};

}
