#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <variant>

namespace EmojiKitchen {

    using WallClock = std::function<std::chrono::system_clock::time_point()>;

    inline WallClock SystemWallClock() {
        return [] { return std::chrono::system_clock::now(); };
    }

    // A resolved composite image. Never re-probed.
    struct FoundEntry {
        std::string image;
        std::string source_date;
        std::filesystem::path path;
    };

    // Every date in probed_dates returned 404 for the pair. Valid until created_at + notfound_expire_days.
    struct NotFoundEntry {
        std::set<std::string> probed_dates;
        std::chrono::system_clock::time_point created_at;
    };

    using CacheEntry = std::variant<FoundEntry, NotFoundEntry>;

}
