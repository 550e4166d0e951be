#include "MetadataIndex.hpp"
#include "../network/BlockingFetch.hpp"
#include "../parser/KitchenDataParser.hpp"
#include "../utils/FileUtil.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlBuilder.hpp"

namespace EmojiKitchen {

namespace {

bool IsCodepointString(const std::string& cp) {
    if (cp.empty() || cp.size() > 100) return false;
    for (unsigned char c : cp) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || c == '-')) return false;
    }
    return true;
}

} // anonymous namespace

MetadataIndex::MetadataIndex(IHttpClient& client, DateCandidateStore& store, MetadataIndexOptions options)
    : client_(client), store_(store), options_(std::move(options)) {
    std::error_code ec;
    std::filesystem::create_directories(options_.dir, ec);
    if (ec) {
        Logger::Log(LogLevel::Warn, "Could not create metadata directory " + options_.dir.string() + ": " + ec.message());
    }
}

std::filesystem::path MetadataIndex::FileFor(const std::string& codepoint) const {
    return options_.dir / (codepoint + ".json");
}

size_t MetadataIndex::Load() {
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>> loaded;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(options_.dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension() != ".json") continue;

        auto text = FileUtil::ReadFile(path);
        auto meta = text ? KitchenDataParser::Parse(*text) : std::nullopt;
        if (!meta) {
            Logger::Log(LogLevel::Warn, "Skipping unreadable metadata file: " + path.filename().string());
            continue;
        }
        if (!meta->partner_dates.empty()) {
            loaded[path.stem().string()] = std::move(meta->partner_dates);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    index_ = std::move(loaded);
    return index_.size();
}

std::optional<std::string> MetadataIndex::Lookup(const std::string& a, const std::string& b) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [owner, partner] : {std::make_pair(a, b), std::make_pair(b, a)}) {
        auto entry = index_.find(owner);
        if (entry == index_.end()) continue;
        auto date = entry->second.find(partner);
        if (date != entry->second.end() && !date->second.empty()) return date->second;
    }
    return std::nullopt;
}

bool MetadataIndex::NeedsRefresh(const std::string& codepoint) const {
    const auto path = FileFor(codepoint);
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) return true;
    const auto age = std::filesystem::file_time_type::clock::now() - mtime;
    return age > std::chrono::hours(24 * options_.expire_days);
}

bool MetadataIndex::Refresh(const std::string& codepoint) {
    if (!IsCodepointString(codepoint)) return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto failed = failed_at_.find(codepoint);
        if (failed != failed_at_.end() &&
            std::chrono::steady_clock::now() - failed->second < std::chrono::minutes(options_.retry_after_minutes)) {
            return false;
        }
    }

    auto mark_failed = [this, &codepoint] {
        std::lock_guard<std::mutex> lock(mutex_);
        failed_at_[codepoint] = std::chrono::steady_clock::now();
    };

    HttpRequest request;
    request.url = UrlBuilder::MetadataUrl(options_.github_proxy, codepoint);
    request.timeout_ms = options_.timeout_ms;
    FetchResult result = FetchBlocking(client_, std::move(request));
    if (!result.error.empty() || result.status_code != 200) {
        Logger::Log(LogLevel::Debug, "Metadata fetch failed for " + codepoint + ": " +
            (result.error.empty() ? "HTTP " + std::to_string(result.status_code) : result.error));
        mark_failed();
        return false;
    }

    auto meta = KitchenDataParser::Parse(result.content);
    if (!meta) {
        Logger::Log(LogLevel::Debug, "Metadata for " + codepoint + " is not valid JSON");
        mark_failed();
        return false;
    }

    std::string error;
    if (!FileUtil::WriteFileAtomic(FileFor(codepoint), result.content, &error)) {
        Logger::Log(LogLevel::Warn, "Could not cache metadata for " + codepoint + ": " + error);
    }

    const size_t new_dates = store_.Merge(meta->dates);
    if (new_dates > 0) {
        Logger::Log(LogLevel::Info, "Metadata of " + codepoint + " added " + std::to_string(new_dates) + " candidate dates");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    failed_at_.erase(codepoint);
    if (!meta->partner_dates.empty()) {
        index_[codepoint] = std::move(meta->partner_dates);
    }
    return true;
}

bool MetadataIndex::RefreshStale(const EmojiPair& pair) {
    bool refreshed = false;
    for (const auto* cp : {&pair.first, &pair.second}) {
        if (NeedsRefresh(*cp) && Refresh(*cp)) refreshed = true;
        if (pair.first == pair.second) break;
    }
    return refreshed;
}

}
