#include "RemoteDateUpdater.hpp"
#include <nlohmann/json.hpp>
#include "../network/BlockingFetch.hpp"
#include "../parser/KitchenDataParser.hpp"
#include "../utils/FileUtil.hpp"
#include "../utils/Logger.hpp"

namespace EmojiKitchen {

RemoteDateUpdater::RemoteDateUpdater(IHttpClient& client, DateCandidateStore& store, RemoteDateUpdaterOptions options)
    : client_(client), store_(store), options_(std::move(options)) {}

size_t RemoteDateUpdater::LoadCachedDates() {
    if (options_.cache_file.empty()) return 0;
    std::error_code ec;
    if (!std::filesystem::exists(options_.cache_file, ec)) return 0;

    auto text = FileUtil::ReadFile(options_.cache_file);
    if (!text) {
        Logger::Log(LogLevel::Warn, "Could not read date cache: " + options_.cache_file.string());
        return 0;
    }
    auto dates = KitchenDataParser::ParseDateList(*text);
    if (!dates) {
        Logger::Log(LogLevel::Warn, "Ignoring malformed date cache: " + options_.cache_file.string());
        return 0;
    }
    {
        std::lock_guard<std::mutex> lock(known_mutex_);
        known_remote_.insert(dates->begin(), dates->end());
    }
    return store_.Merge(*dates);
}

bool RemoteDateUpdater::Refresh() {
    HttpRequest request;
    request.url = options_.url;
    request.timeout_ms = options_.timeout_ms;

    FetchResult result = FetchBlocking(client_, std::move(request));
    if (!result.error.empty()) {
        Logger::Log(LogLevel::Warn, "Remote date update failed: " + result.error);
        return false;
    }
    if (result.status_code != 200) {
        Logger::Log(LogLevel::Warn, "Remote date update failed: HTTP " + std::to_string(result.status_code));
        return false;
    }

    auto dates = KitchenDataParser::ParseDateList(result.content);
    if (!dates) {
        Logger::Log(LogLevel::Warn, "Remote date update failed: unparseable document");
        return false;
    }
    if (dates->empty()) {
        Logger::Log(LogLevel::Warn, "Remote date document listed no dates");
        return false;
    }

    const size_t added = store_.Merge(*dates);
    bool grew = false;
    {
        std::lock_guard<std::mutex> lock(known_mutex_);
        const size_t before = known_remote_.size();
        known_remote_.insert(dates->begin(), dates->end());
        grew = known_remote_.size() != before;
    }
    if (grew) PersistKnownDates();

    Logger::Log(LogLevel::Info, "Date list updated: " + std::to_string(added) + " new, " + std::to_string(store_.Size()) + " total");
    return true;
}

void RemoteDateUpdater::PersistKnownDates() {
    if (options_.cache_file.empty()) return;

    nlohmann::json data = nlohmann::json::array();
    {
        std::lock_guard<std::mutex> lock(known_mutex_);
        for (auto it = known_remote_.rbegin(); it != known_remote_.rend(); ++it) data.push_back(*it);
    }

    std::error_code ec;
    if (options_.cache_file.has_parent_path()) {
        std::filesystem::create_directories(options_.cache_file.parent_path(), ec);
    }
    std::string error;
    if (!FileUtil::WriteFileAtomic(options_.cache_file, data.dump(), &error)) {
        Logger::Log(LogLevel::Warn, "Could not persist date cache: " + error);
    }
}

void RemoteDateUpdater::Start(JobScheduler& scheduler) {
    ScheduleNext(scheduler, 0);
}

void RemoteDateUpdater::Stop() {
    std::lock_guard<std::mutex> lock(schedule_mutex_);
    stopped_ = true;
}

void RemoteDateUpdater::ScheduleNext(JobScheduler& scheduler, int delay_seconds) {
    std::lock_guard<std::mutex> lock(schedule_mutex_);
    if (stopped_) return;
    scheduler.Schedule(kJobName, delay_seconds, [this, &scheduler]() {
        if (stopped_) return;
        Refresh();
        const int hours = options_.refresh_hours > 0 ? options_.refresh_hours : 24;
        // The scheduler is only touched under schedule_mutex_ while not stopped.
        ScheduleNext(scheduler, hours * 3600);
    });
}

}
