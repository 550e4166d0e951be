#include <catch2/catch_all.hpp>
#include <algorithm>
#include <atomic>
#include <thread>
#include "core/DateCandidateStore.hpp"

using namespace EmojiKitchen;

namespace {

bool IsNewestFirst(const std::vector<std::string>& dates) {
    return std::is_sorted(dates.begin(), dates.end(), std::greater<std::string>()) &&
           std::adjacent_find(dates.begin(), dates.end()) == dates.end();
}

} // namespace

TEST_CASE("Default store holds the baseline newest first") {
    DateCandidateStore store;
    auto snap = store.GetSnapshot();
    REQUIRE(snap->size() == DateCandidateStore::BaselineDates().size());
    CHECK(IsNewestFirst(*snap));
    CHECK(snap->front() == "20251029");
    CHECK(snap->back() == "20201001");
}

TEST_CASE("Merge is an idempotent union that ignores malformed dates") {
    DateCandidateStore store({"20220101", "20200101"});

    CHECK(store.Merge({"20230101", "20220101", "2023-01-01", "abc", "202301011"}) == 1);
    CHECK(store.Merge({"20230101"}) == 0);
    CHECK(store.Merge({}) == 0);

    auto snap = store.GetSnapshot();
    CHECK(*snap == std::vector<std::string>{"20230101", "20220101", "20200101"});
}

TEST_CASE("A snapshot is unaffected by later merges") {
    DateCandidateStore store({"20220101"});
    auto before = store.GetSnapshot();

    store.Merge({"20240101"});
    auto after = store.GetSnapshot();

    CHECK(*before == std::vector<std::string>{"20220101"});
    CHECK(*after == std::vector<std::string>{"20240101", "20220101"});
}

TEST_CASE("Readers always see a complete, ordered superset of the baseline") {
    const std::vector<std::string> baseline = {"20220101", "20210101"};
    DateCandidateStore store(baseline);
    std::atomic<bool> done{false};
    std::atomic<int> bad{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 3; ++i) {
        readers.emplace_back([&] {
            size_t last_size = 0;
            while (!done.load()) {
                auto snap = store.GetSnapshot();
                if (!IsNewestFirst(*snap) || snap->size() < last_size) ++bad;
                for (const auto& d : baseline) {
                    if (std::find(snap->begin(), snap->end(), d) == snap->end()) ++bad;
                }
                last_size = snap->size();
            }
        });
    }

    std::thread writer([&] {
        for (int day = 1; day <= 28; ++day) {
            std::string d = "202301" + std::string(day < 10 ? "0" : "") + std::to_string(day);
            store.Merge({d});
        }
    });
    writer.join();
    done = true;
    for (auto& t : readers) t.join();

    CHECK(bad == 0);
    CHECK(store.Size() == baseline.size() + 28);
}

TEST_CASE("ParseDateLines keeps well-formed lines only") {
    auto dates = DateCandidateStore::ParseDateLines("20250101\n  20240202 \r\n\nnot-a-date\n2024\n20240202\n");
    CHECK(dates == std::set<std::string>{"20250101", "20240202"});
    CHECK(DateCandidateStore::ParseDateLines("").empty());
}
