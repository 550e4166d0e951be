#pragma once
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace EmojiKitchen {
    // Deduplicated candidate generation dates, newest first.
    // Readers get an immutable snapshot; Merge publishes a new list with one atomic pointer swap,
    // so a reader never sees a half-merged list and never waits for a writer.
    class DateCandidateStore {
    public:
        using Snapshot = std::shared_ptr<const std::vector<std::string>>;

        // Seeds the store with the built-in baseline.
        DateCandidateStore();
        // Seeds the store with a custom baseline (tests, or a deployment that knows better).
        explicit DateCandidateStore(const std::vector<std::string>& baseline);

        DateCandidateStore(const DateCandidateStore&) = delete;
        DateCandidateStore& operator=(const DateCandidateStore&) = delete;

        // Idempotent union. Strings that are not YYYYMMDD are ignored. Returns how many dates were new.
        size_t Merge(const std::set<std::string>& dates);

        Snapshot GetSnapshot() const;
        size_t Size() const { return GetSnapshot()->size(); }

        // Dates shipped with the bot; the store is always a superset of these.
        static const std::vector<std::string>& BaselineDates();

        // Parses newline separated dates (the extra_dates setting). Blank and malformed lines are skipped.
        static std::set<std::string> ParseDateLines(const std::string& text);

    private:
        Snapshot snapshot_;
        std::mutex merge_mutex_; // serializes writers only
    };
}
