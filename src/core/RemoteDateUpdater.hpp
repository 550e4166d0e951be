#pragma once
#include <atomic>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include "DateCandidateStore.hpp"
#include "JobScheduler.hpp"
#include "../interfaces/IHttpClient.hpp"

namespace EmojiKitchen {

    struct RemoteDateUpdaterOptions {
        std::string url;                    // remote date document
        std::filesystem::path cache_file;   // dates_cache.json; empty disables persistence
        long timeout_ms = 10000;
        int refresh_hours = 24;
    };

    // Keeps the candidate store fresh from the remote date document.
    // Failures only cost freshness: they are logged and the store keeps its current snapshot.
    class RemoteDateUpdater {
    public:
        RemoteDateUpdater(IHttpClient& client, DateCandidateStore& store, RemoteDateUpdaterOptions options);

        // Merges dates persisted by an earlier run. Returns how many were new to the store.
        size_t LoadCachedDates();

        // Fetches, parses and merges the remote document, then persists what is known. Blocking.
        bool Refresh();

        // Refreshes right away, then every refresh_hours.
        void Start(JobScheduler& scheduler);

        // After Stop returns no job re-arms itself, so the scheduler may be destroyed even while a
        // refresh is still running on the pool.
        void Stop();

        static constexpr const char* kJobName = "remote-date-refresh";

    private:
        void ScheduleNext(JobScheduler& scheduler, int delay_seconds);
        void PersistKnownDates();

        IHttpClient& client_;
        DateCandidateStore& store_;
        RemoteDateUpdaterOptions options_;
        std::set<std::string> known_remote_;
        std::mutex known_mutex_;
        std::atomic<bool> stopped_{false};
        std::mutex schedule_mutex_;
    };
}
