#include "DateCandidateStore.hpp"
#include <atomic>
#include <sstream>
#include "KitchenTypes.hpp"

namespace EmojiKitchen {

namespace {

DateCandidateStore::Snapshot MakeSorted(std::set<std::string> dates) {
    auto list = std::make_shared<std::vector<std::string>>(dates.rbegin(), dates.rend());
    return list;
}

} // anonymous namespace

const std::vector<std::string>& DateCandidateStore::BaselineDates() {
    static const std::vector<std::string> baseline = {
        "20251029", "20250501", "20250430", "20250204", "20250130",
        "20241023", "20241021", "20240610", "20240530", "20240214",
        "20240206", "20231128", "20231113", "20230821", "20230818",
        "20230803", "20230426", "20230418", "20230301", "20230216",
        "20230127", "20230126", "20221107", "20221101", "20220815",
        "20220506", "20220406", "20220203", "20220110", "20211115",
        "20210831", "20210521", "20210218", "20201001",
    };
    return baseline;
}

DateCandidateStore::DateCandidateStore() : DateCandidateStore(BaselineDates()) {}

DateCandidateStore::DateCandidateStore(const std::vector<std::string>& baseline) {
    std::set<std::string> dates;
    for (const auto& d : baseline) {
        if (IsCandidateDate(d)) dates.insert(d);
    }
    std::atomic_store(&snapshot_, MakeSorted(std::move(dates)));
}

size_t DateCandidateStore::Merge(const std::set<std::string>& dates) {
    std::lock_guard<std::mutex> lock(merge_mutex_);
    Snapshot current = std::atomic_load(&snapshot_);

    std::set<std::string> merged(current->begin(), current->end());
    const size_t before = merged.size();
    for (const auto& d : dates) {
        if (IsCandidateDate(d)) merged.insert(d);
    }
    const size_t added = merged.size() - before;
    if (added == 0) return 0;

    std::atomic_store(&snapshot_, MakeSorted(std::move(merged)));
    return added;
}

DateCandidateStore::Snapshot DateCandidateStore::GetSnapshot() const {
    return std::atomic_load(&snapshot_);
}

std::set<std::string> DateCandidateStore::ParseDateLines(const std::string& text) {
    std::set<std::string> dates;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        const char* ws = " \t\r";
        auto b = line.find_first_not_of(ws);
        if (b == std::string::npos) continue;
        auto e = line.find_last_not_of(ws);
        std::string d = line.substr(b, e - b + 1);
        if (IsCandidateDate(d)) dates.insert(std::move(d));
    }
    return dates;
}

}
