#pragma once
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "DateCandidateStore.hpp"
#include "KitchenTypes.hpp"
#include "../interfaces/IHttpClient.hpp"

namespace EmojiKitchen {

    struct MetadataIndexOptions {
        std::filesystem::path dir;       // metadata/{cp}.json
        std::string github_proxy;        // empty = direct
        long timeout_ms = 10000;
        int expire_days = 7;
        int retry_after_minutes = 60;    // after a failed fetch, leave the emoji alone this long
    };

    // Per-emoji combination metadata from emoji-kitchen-backend: which date holds each partner.
    // Lets the resolver try the one right date before probing blindly.
    class MetadataIndex {
    public:
        MetadataIndex(IHttpClient& client, DateCandidateStore& store, MetadataIndexOptions options);

        // Indexes every cached metadata file. Unreadable files are logged and skipped.
        size_t Load();

        // Date of the pair from either emoji's metadata.
        std::optional<std::string> Lookup(const std::string& a, const std::string& b) const;

        // True when the cached file is missing or older than expire_days.
        bool NeedsRefresh(const std::string& codepoint) const;

        // Fetches and caches one emoji's metadata, re-indexes it and merges its dates into the store.
        bool Refresh(const std::string& codepoint);

        // Refreshes whichever of the two emoji is stale. Returns true if anything new was indexed.
        bool RefreshStale(const EmojiPair& pair);

    private:
        std::filesystem::path FileFor(const std::string& codepoint) const;

        IHttpClient& client_;
        DateCandidateStore& store_;
        MetadataIndexOptions options_;
        std::unordered_map<std::string, std::unordered_map<std::string, std::string>> index_;
        std::unordered_map<std::string, std::chrono::steady_clock::time_point> failed_at_;
        mutable std::mutex mutex_;
    };
}
