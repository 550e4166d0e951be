#include "CacheStore.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <stdexcept>
#include "../core/KitchenTypes.hpp"
#include "../utils/FileUtil.hpp"
#include "../utils/Logger.hpp"

namespace EmojiKitchen {

namespace {

// Keys are codepoint strings joined by '_'; anything else must not reach the filesystem.
bool IsSafeKey(const std::string& key) {
    if (key.empty() || key.size() > 200) return false;
    for (unsigned char c : key) {
        bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

void RemoveQuietly(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::remove(p, ec);
}

} // anonymous namespace

CacheStore::CacheStore(const std::filesystem::path& root, int notfound_expire_days, WallClock clock)
    : image_dir_(root / "cache"),
      notfound_dir_(root / "notfound"),
      notfound_ttl_(std::chrono::hours(24) * std::max(0, notfound_expire_days)),
      clock_(clock ? std::move(clock) : SystemWallClock()) {
    std::error_code ec;
    std::filesystem::create_directories(image_dir_, ec);
    if (ec) throw std::runtime_error("Could not create cache directory " + image_dir_.string() + ": " + ec.message());
    std::filesystem::create_directories(notfound_dir_, ec);
    if (ec) throw std::runtime_error("Could not create cache directory " + notfound_dir_.string() + ": " + ec.message());
}

std::filesystem::path CacheStore::ImagePath(const std::string& key) const {
    return image_dir_ / (key + ".png");
}

std::filesystem::path CacheStore::MarkerPath(const std::string& key) const {
    return notfound_dir_ / (key + ".json");
}

bool CacheStore::LooksLikePng(const std::string& data) {
    static const char kMagic[] = "\x89PNG\r\n\x1a\n";
    return data.size() >= 8 && data.compare(0, 8, kMagic, 8) == 0;
}

bool CacheStore::IsFullCoverage(const std::set<std::string>& probed_dates, const std::vector<std::string>& snapshot) {
    for (const auto& d : snapshot) {
        if (probed_dates.find(d) == probed_dates.end()) return false;
    }
    return true;
}

std::optional<CacheEntry> CacheStore::Get(const std::string& key) {
    if (!IsSafeKey(key)) return std::nullopt;
    if (auto found = ReadFound(key, true)) return CacheEntry{std::move(*found)};
    if (auto missing = ReadNotFound(key)) return CacheEntry{std::move(*missing)};
    return std::nullopt;
}

std::optional<FoundEntry> CacheStore::PeekFound(const std::string& key) {
    if (!IsSafeKey(key)) return std::nullopt;
    return ReadFound(key, false);
}

std::optional<FoundEntry> CacheStore::ReadFound(const std::string& key, bool discard_corrupt) {
    const auto path = ImagePath(key);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return std::nullopt;

    auto image = FileUtil::ReadFile(path);
    if (!image) return std::nullopt;
    if (!LooksLikePng(*image)) {
        if (discard_corrupt) {
            Logger::Log(LogLevel::Warn, "Discarding corrupt cached image: " + path.string());
            RemoveQuietly(path);
        }
        return std::nullopt;
    }

    FoundEntry entry;
    entry.image = std::move(*image);
    entry.path = path;
    if (auto date = FileUtil::ReadFile(image_dir_ / (key + ".date"))) {
        std::string d = date->substr(0, date->find_first_of("\r\n"));
        if (IsCandidateDate(d)) entry.source_date = d;
    }
    return entry;
}

std::optional<NotFoundEntry> CacheStore::ReadNotFound(const std::string& key) {
    const auto path = MarkerPath(key);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return std::nullopt;

    auto text = FileUtil::ReadFile(path);
    if (!text) return std::nullopt;

    nlohmann::json data = nlohmann::json::parse(*text, nullptr, /*allow_exceptions=*/false);
    auto created = data.is_object() ? data.find("created_at") : data.end();
    auto probed = data.is_object() ? data.find("probed_dates") : data.end();
    if (data.is_discarded() || !data.is_object() || created == data.end() || !created->is_number_integer()
        || probed == data.end() || !probed->is_array()) {
        Logger::Log(LogLevel::Warn, "Discarding corrupt not-found marker: " + path.string());
        RemoveQuietly(path);
        return std::nullopt;
    }

    NotFoundEntry entry;
    entry.created_at = std::chrono::system_clock::time_point(std::chrono::seconds(created->get<long long>()));
    for (const auto& d : *probed) {
        if (d.is_string() && IsCandidateDate(d.get<std::string>())) entry.probed_dates.insert(d.get<std::string>());
    }

    if (clock_() >= entry.created_at + notfound_ttl_) {
        Logger::Log(LogLevel::Debug, "Not-found marker expired for: " + key);
        RemoveQuietly(path);
        return std::nullopt;
    }
    return entry;
}

bool CacheStore::PutFound(const std::string& key, const std::string& image, const std::string& source_date) {
    if (!IsSafeKey(key) || image.empty()) return false;

    std::string error;
    if (!FileUtil::WriteFileAtomic(image_dir_ / (key + ".date"), source_date + "\n", &error)) {
        Logger::Log(LogLevel::Warn, "Failed to write source date for " + key + ": " + error);
    }
    if (!FileUtil::WriteFileAtomic(ImagePath(key), image, &error)) {
        Logger::Log(LogLevel::Warn, "Failed to cache image for " + key + ": " + error);
        return false;
    }
    RemoveQuietly(MarkerPath(key));
    return true;
}

bool CacheStore::PutNotFound(const std::string& key, const std::set<std::string>& probed_dates) {
    if (!IsSafeKey(key)) return false;

    const auto now = std::chrono::duration_cast<std::chrono::seconds>(clock_().time_since_epoch()).count();
    nlohmann::json data;
    data["created_at"] = static_cast<long long>(now);
    data["probed_dates"] = probed_dates;

    std::string error;
    if (!FileUtil::WriteFileAtomic(MarkerPath(key), data.dump(), &error)) {
        Logger::Log(LogLevel::Warn, "Failed to write not-found marker for " + key + ": " + error);
        return false;
    }
    return true;
}

}
