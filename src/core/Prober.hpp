#pragma once
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "KitchenTypes.hpp"
#include "DateCandidateStore.hpp"
#include "../cache/ProbeTracker.hpp"
#include "../interfaces/IHttpClient.hpp"
#include "../interfaces/IImageCache.hpp"
#include "../utils/ProbeLimiter.hpp"

namespace EmojiKitchen {

    struct ProberOptions {
        size_t max_probe_dates = 10;
        long request_timeout_ms = 10000;
        size_t max_image_bytes = 4 * 1024 * 1024;
    };

    enum class ProbeStatus {
        Found,          // image available (cached or just fetched)
        NotFound,       // every known candidate date answered 404
        TransientMiss,  // nothing found yet, but some candidates are still untried
        InfraError      // no request produced a usable answer
    };

    struct ProbeOutcome {
        ProbeStatus status = ProbeStatus::TransientMiss;
        std::string image;
        std::string source_date;
        size_t requests = 0;
    };

    // What came back from probing one fixed list of dates.
    struct AttemptReport {
        bool found = false;
        std::string image;
        std::string date;
        std::set<std::string> missing_dates; // every URL for the date answered 404
        size_t failures = 0;                 // timeouts, connection errors, unexpected statuses
        size_t requests = 0;
        bool rate_limited = false;
    };

    class Prober {
    public:
        Prober(IHttpClient& client, ProbeLimiter& limiter, DateCandidateStore& dates, IImageCache& cache,
               ProbeTracker& tracker, ProbeUrlBuilder url_builder, ProberOptions options);

        // Resolves one pair against the cache and, on a miss, against at most max_probe_dates
        // untried candidate dates. Writes Found or NotFound entries; a partial miss writes nothing.
        ProbeOutcome Probe(const std::string& key, const EmojiPair& pair);

        // Probes one date known from metadata. A hit is cached and clears the key's progress;
        // a clean 404 is recorded as progress so the blind probe skips that date.
        ProbeOutcome ProbeExact(const std::string& key, const EmojiPair& pair, const std::string& date);

        // Probes the given dates (newest first) concurrently under the global limiter. The reported
        // image is the one from the earliest date in the list that has it: a hit cancels the older
        // dates at once but waits for newer dates still in flight. Does not touch the cache.
        AttemptReport ProbeDates(const EmojiPair& pair, const std::vector<std::string>& dates);

    private:
        struct Attempt;
        static void OnResponse(Attempt& attempt, size_t index, const std::string& url, FetchResult result);

        IHttpClient& client_;
        ProbeLimiter& limiter_;
        DateCandidateStore& dates_;
        IImageCache& cache_;
        ProbeTracker& tracker_;
        ProbeUrlBuilder url_builder_;
        ProberOptions options_;
    };
}
