#include "Prober.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <variant>
#include "../cache/CacheStore.hpp"
#include "../utils/Logger.hpp"

namespace EmojiKitchen {

namespace {
constexpr size_t kNoWinner = static_cast<size_t>(-1);
}

// Shared between the dispatching thread and the HTTP callbacks; callbacks may outlive ProbeDates.
// Dates are indexed in the order given, newest first.
struct Prober::Attempt {
    struct DateState {
        std::string date;
        size_t urls = 0;
        size_t outstanding = 0;
        size_t not_found = 0;
        std::shared_ptr<std::atomic<bool>> cancelled = std::make_shared<std::atomic<bool>>(false);
    };

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<DateState> dates;
    size_t outstanding = 0;
    size_t winner = kNoWinner;
    AttemptReport report;

    void CancelFrom(size_t index) {
        for (size_t i = index; i < dates.size(); ++i) dates[i].cancelled->store(true);
    }

    // Done once every request answered, or once a hit exists and no newer date can still beat it.
    bool Settled() const {
        if (outstanding == 0) return true;
        if (winner == kNoWinner) return false;
        for (size_t i = 0; i < winner; ++i) {
            if (dates[i].outstanding > 0) return false;
        }
        return true;
    }
};

Prober::Prober(IHttpClient& client, ProbeLimiter& limiter, DateCandidateStore& dates, IImageCache& cache,
               ProbeTracker& tracker, ProbeUrlBuilder url_builder, ProberOptions options)
    : client_(client), limiter_(limiter), dates_(dates), cache_(cache), tracker_(tracker),
      url_builder_(std::move(url_builder)), options_(options) {
    options_.max_probe_dates = std::max<size_t>(1, options_.max_probe_dates);
}

void Prober::OnResponse(Attempt& attempt, size_t index, const std::string& url, FetchResult result) {
    std::lock_guard<std::mutex> lock(attempt.mutex);
    auto& state = attempt.dates[index];
    --attempt.outstanding;
    --state.outstanding;
    auto& report = attempt.report;

    if (attempt.winner <= index) {
        // A newer (or the same) date already holds the image; this answer cannot change the result.
    } else if (result.cancelled) {
        Logger::Log(LogLevel::Debug, "Probe cancelled: " + url);
    } else if (!result.error.empty()) {
        ++report.failures;
        Logger::Log(LogLevel::Debug, "Probe failed: " + url + " - " + result.error);
    } else if (result.status_code == 404) {
        if (++state.not_found == state.urls) {
            report.missing_dates.insert(state.date);
        }
    } else if (result.status_code == 200 && !result.truncated && CacheStore::LooksLikePng(result.content)) {
        attempt.winner = index;
        report.found = true;
        report.image = std::move(result.content);
        report.date = state.date;
        attempt.CancelFrom(index);
        Logger::Log(LogLevel::Debug, "Probe hit: " + url);
    } else if (result.status_code == 429) {
        ++report.failures;
        report.rate_limited = true;
        attempt.CancelFrom(0);
        Logger::Log(LogLevel::Warn, "CDN rate limited the probe, stopping this attempt: " + url);
    } else {
        ++report.failures;
        if (result.status_code == 200) {
            Logger::Log(LogLevel::Warn, "CDN answered with something that is not a PNG: " + url);
        } else {
            Logger::Log(LogLevel::Warn, "Unexpected CDN status " + std::to_string(result.status_code) + ": " + url);
        }
    }
    attempt.cv.notify_all();
}

AttemptReport Prober::ProbeDates(const EmojiPair& pair, const std::vector<std::string>& dates) {
    auto attempt = std::make_shared<Attempt>();

    // The date table is complete before the first request so callbacks never see it resize.
    std::vector<std::vector<std::string>> urls_by_date;
    for (const auto& date : dates) {
        auto urls = url_builder_(pair, date);
        if (urls.empty()) continue;
        Attempt::DateState state;
        state.date = date;
        state.urls = urls.size();
        attempt->dates.push_back(std::move(state));
        urls_by_date.push_back(std::move(urls));
    }

    for (size_t index = 0; index < attempt->dates.size(); ++index) {
        const auto cancelled = attempt->dates[index].cancelled;

        for (const auto& url : urls_by_date[index]) {
            if (!limiter_.Acquire(cancelled.get())) break;
            {
                std::lock_guard<std::mutex> lock(attempt->mutex);
                ++attempt->outstanding;
                ++attempt->dates[index].outstanding;
                ++attempt->report.requests;
            }

            HttpRequest request;
            request.url = url;
            request.timeout_ms = options_.request_timeout_ms;
            request.max_bytes = options_.max_image_bytes;
            request.cancelled = cancelled;

            ProbeLimiter& limiter = limiter_;
            // The slot is given back after the response is recorded, so a winner's cancellation is
            // visible to a dispatcher waiting in Acquire before it can take the freed slot.
            client_.Fetch(std::move(request), [attempt, index, url, &limiter](FetchResult result) {
                OnResponse(*attempt, index, url, std::move(result));
                limiter.Release();
            });
        }
        // Set once this date or a newer one hit, or the CDN rate limited us.
        if (cancelled->load()) break;
    }

    std::unique_lock<std::mutex> lock(attempt->mutex);
    attempt->cv.wait(lock, [&attempt] { return attempt->Settled(); });
    return attempt->report;
}

ProbeOutcome Prober::ProbeExact(const std::string& key, const EmojiPair& pair, const std::string& date) {
    ProbeOutcome outcome;
    AttemptReport report = ProbeDates(pair, {date});
    outcome.requests = report.requests;

    if (report.found) {
        if (!cache_.PutFound(key, report.image, report.date)) {
            Logger::Log(LogLevel::Warn, "Resolved " + key + " but could not cache it");
        }
        tracker_.Clear(key);
        outcome.status = ProbeStatus::Found;
        outcome.image = std::move(report.image);
        outcome.source_date = std::move(report.date);
        return outcome;
    }

    if (!report.missing_dates.empty()) {
        auto tried = tracker_.Get(key);
        tried.insert(report.missing_dates.begin(), report.missing_dates.end());
        tracker_.Record(key, tried);
        outcome.status = ProbeStatus::TransientMiss;
    } else {
        outcome.status = report.failures > 0 ? ProbeStatus::InfraError : ProbeStatus::TransientMiss;
    }
    return outcome;
}

ProbeOutcome Prober::Probe(const std::string& key, const EmojiPair& pair) {
    ProbeOutcome outcome;
    const auto snapshot = dates_.GetSnapshot();
    std::set<std::string> tried = tracker_.Get(key);

    if (auto cached = cache_.Get(key)) {
        if (auto* found = std::get_if<FoundEntry>(&*cached)) {
            outcome.status = ProbeStatus::Found;
            outcome.image = std::move(found->image);
            outcome.source_date = found->source_date;
            return outcome;
        }
        const auto& missing = std::get<NotFoundEntry>(*cached);
        if (CacheStore::IsFullCoverage(missing.probed_dates, *snapshot)) {
            outcome.status = ProbeStatus::NotFound;
            return outcome;
        }
        // The candidate list grew since the marker was written; only the new dates need probing.
        Logger::Log(LogLevel::Info, "Candidate dates changed since " + key + " was marked missing, probing new dates");
        tried.insert(missing.probed_dates.begin(), missing.probed_dates.end());
    }

    std::vector<std::string> candidates;
    for (const auto& d : *snapshot) {
        if (candidates.size() >= options_.max_probe_dates) break;
        if (tried.find(d) == tried.end()) candidates.push_back(d);
    }

    AttemptReport report;
    if (!candidates.empty()) {
        report = ProbeDates(pair, candidates);
        outcome.requests = report.requests;
    }

    if (report.found) {
        if (!cache_.PutFound(key, report.image, report.date)) {
            Logger::Log(LogLevel::Warn, "Resolved " + key + " but could not cache it");
        }
        tracker_.Clear(key);
        Logger::Log(LogLevel::Info, "Resolved " + key + " at date " + report.date);
        outcome.status = ProbeStatus::Found;
        outcome.image = std::move(report.image);
        outcome.source_date = std::move(report.date);
        return outcome;
    }

    tried.insert(report.missing_dates.begin(), report.missing_dates.end());

    if (CacheStore::IsFullCoverage(tried, *snapshot)) {
        cache_.PutNotFound(key, tried);
        tracker_.Clear(key);
        Logger::Log(LogLevel::Info, "No combination exists for " + key + " across " + std::to_string(snapshot->size()) + " dates");
        outcome.status = ProbeStatus::NotFound;
        return outcome;
    }

    if (!report.missing_dates.empty()) {
        tracker_.Record(key, tried);
    }

    if (report.missing_dates.empty() && report.failures > 0) {
        if (report.rate_limited) {
            Logger::Log(LogLevel::Warn, "CDN is rate limiting, giving up on " + key + " for now");
        } else {
            Logger::Log(LogLevel::Warn, "CDN unreachable while probing " + key + " (" + std::to_string(report.failures) + " failed requests)");
        }
        outcome.status = ProbeStatus::InfraError;
        return outcome;
    }

    Logger::Log(LogLevel::Info, "No hit for " + key + " yet (" + std::to_string(tried.size()) + "/" + std::to_string(snapshot->size()) + " dates probed)");
    outcome.status = ProbeStatus::TransientMiss;
    return outcome;
}

}
