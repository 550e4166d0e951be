#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "../interfaces/IImageCache.hpp"

namespace EmojiKitchen {
    // Durable per-pair cache under a root directory:
    //   cache/{key}.png       image bytes
    //   cache/{key}.date      generation date the image came from
    //   notfound/{key}.json   {"created_at": unix seconds, "probed_dates": [...]}
    // Every file is written to a private temporary name and renamed into place.
    class CacheStore : public IImageCache {
    public:
        CacheStore(const std::filesystem::path& root, int notfound_expire_days, WallClock clock = SystemWallClock());

        std::optional<CacheEntry> Get(const std::string& key) override;
        std::optional<FoundEntry> PeekFound(const std::string& key) override;
        bool PutFound(const std::string& key, const std::string& image, const std::string& source_date) override;
        bool PutNotFound(const std::string& key, const std::set<std::string>& probed_dates) override;

        // True iff every snapshot date was probed.
        static bool IsFullCoverage(const std::set<std::string>& probed_dates, const std::vector<std::string>& snapshot);

        static bool LooksLikePng(const std::string& data);

        std::filesystem::path ImagePath(const std::string& key) const;
        std::filesystem::path MarkerPath(const std::string& key) const;

    private:
        std::optional<FoundEntry> ReadFound(const std::string& key, bool discard_corrupt);
        std::optional<NotFoundEntry> ReadNotFound(const std::string& key);

        std::filesystem::path image_dir_;
        std::filesystem::path notfound_dir_;
        std::chrono::seconds notfound_ttl_;
        WallClock clock_;
    };
}
