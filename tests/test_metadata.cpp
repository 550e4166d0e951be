#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <thread>
#include "TestSupport.hpp"
#include "cache/CacheStore.hpp"
#include "cache/ProbeTracker.hpp"
#include "core/DateCandidateStore.hpp"
#include "core/JobScheduler.hpp"
#include "core/MetadataIndex.hpp"
#include "core/Prober.hpp"
#include "core/RemoteDateUpdater.hpp"
#include "core/Resolver.hpp"
#include "parser/KitchenDataParser.hpp"
#include "utils/FileUtil.hpp"
#include "utils/KeyLocks.hpp"
#include "utils/ProbeLimiter.hpp"
#include "utils/ThreadPool.hpp"
#include "utils/UrlBuilder.hpp"

using namespace EmojiKitchen;
using namespace EmojiKitchen::Testing;

namespace {

// Shape of emoji/data/1f600.json in emoji-kitchen-backend, trimmed to what is read.
const char* kGrinData = R"({
    "alt": "grinning face",
    "combinations": {
        "1f60e": [
            {"date": "20201001", "isLatest": false, "leftEmojiCodepoint": "1f600", "rightEmojiCodepoint": "1f60e"},
            {"date": "20231029", "isLatest": true, "leftEmojiCodepoint": "1f600", "rightEmojiCodepoint": "1f60e"}
        ],
        "2764-fe0f": [
            {"date": "20220203", "leftEmojiCodepoint": "2764-fe0f", "rightEmojiCodepoint": "1f600"},
            {"date": "20210218", "leftEmojiCodepoint": "2764-fe0f", "rightEmojiCodepoint": "1f600"}
        ],
        "1f4a9": []
    }
})";

} // namespace

TEST_CASE("KitchenDataParser picks the latest date per partner") {
    auto meta = KitchenDataParser::Parse(kGrinData);
    REQUIRE(meta.has_value());
    CHECK(meta->partner_dates.at("1f60e") == "20231029");
    CHECK(meta->partner_dates.at("2764-fe0f") == "20220203"); // no isLatest: first entry
    CHECK(meta->partner_dates.count("1f4a9") == 0);
    CHECK(meta->dates == std::set<std::string>{"20201001", "20231029", "20220203", "20210218"});

    CHECK_FALSE(KitchenDataParser::Parse("{oops").has_value());
}

TEST_CASE("KitchenDataParser reads date lists in either shape") {
    auto plain = KitchenDataParser::ParseDateList(R"(["20250101", "bogus", 42, "20240101"])");
    REQUIRE(plain.has_value());
    CHECK(*plain == std::set<std::string>{"20250101", "20240101"});

    auto doc = KitchenDataParser::ParseDateList(kGrinData);
    REQUIRE(doc.has_value());
    CHECK(doc->size() == 4);

    CHECK_FALSE(KitchenDataParser::ParseDateList(R"({"unrelated": true})").has_value());
    CHECK_FALSE(KitchenDataParser::ParseDateList("not json").has_value());
}

TEST_CASE("RemoteDateUpdater merges and persists remote dates") {
    TempDir dir;
    DateCandidateStore store({"20200101"});
    FakeHttpClient http;
    const std::string url = "https://example.test/dates.json";
    RemoteDateUpdater updater(http, store, {url, dir.path() / "dates_cache.json", 1000, 24});

    http.Set(url, {200, kGrinData});
    REQUIRE(updater.Refresh());
    CHECK(store.Size() == 5);
    CHECK(store.GetSnapshot()->front() == "20231029");

    auto persisted = FileUtil::ReadFile(dir.path() / "dates_cache.json");
    REQUIRE(persisted.has_value());
    auto json = nlohmann::json::parse(*persisted);
    REQUIRE(json.is_array());
    CHECK(json.size() == 4);
    CHECK(json.front() == "20231029");

    SECTION("a later run starts from the persisted dates") {
        DateCandidateStore fresh({"20200101"});
        FakeHttpClient offline;
        RemoteDateUpdater restarted(offline, fresh, {url, dir.path() / "dates_cache.json", 1000, 24});
        CHECK(restarted.LoadCachedDates() == 4);
        CHECK(fresh.Size() == 5);
        CHECK(offline.RequestCount() == 0);
    }
}

TEST_CASE("RemoteDateUpdater failures keep the current snapshot") {
    TempDir dir;
    DateCandidateStore store({"20200101"});
    FakeHttpClient http;
    const std::string url = "https://example.test/dates.json";
    RemoteDateUpdater updater(http, store, {url, dir.path() / "dates_cache.json", 1000, 24});
    auto before = store.GetSnapshot();

    SECTION("HTTP error") {
        http.Set(url, {503, "busy"});
        CHECK_FALSE(updater.Refresh());
    }
    SECTION("connection error") {
        http.Set(url, {0, "", "Could not resolve host"});
        CHECK_FALSE(updater.Refresh());
    }
    SECTION("malformed document") {
        http.Set(url, {200, "<html>"});
        CHECK_FALSE(updater.Refresh());
    }

    CHECK(*store.GetSnapshot() == *before);
    CHECK_FALSE(std::filesystem::exists(dir.path() / "dates_cache.json"));
}

TEST_CASE("A stopped RemoteDateUpdater never re-arms into a destroyed scheduler") {
    TempDir dir;
    DateCandidateStore store({"20200101"});
    FakeHttpClient http(true);
    const std::string url = "https://example.test/dates.json";
    http.Set(url, {200, kGrinData, "", std::chrono::milliseconds(300)});
    RemoteDateUpdater updater(http, store, {url, dir.path() / "dates_cache.json", 2000, 24});

    {
        ThreadPool pool(1);
        auto scheduler = std::make_unique<JobScheduler>(pool);
        updater.Start(*scheduler);
        for (int i = 0; i < 400 && http.RequestCount() == 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        REQUIRE(http.RequestCount() == 1);

        // Shutdown order of main: stop the updater, then the scheduler goes while the refresh runs.
        updater.Stop();
        scheduler.reset();
    } // the pool waits for the running refresh

    CHECK(store.Size() == 5);
    CHECK(http.RequestCount() == 1);
}

TEST_CASE("Stop keeps the refresh job from scheduling itself again") {
    TempDir dir;
    DateCandidateStore store({"20200101"});
    FakeHttpClient http;
    const std::string url = "https://example.test/dates.json";
    http.Set(url, {200, kGrinData});
    RemoteDateUpdater updater(http, store, {url, dir.path() / "dates_cache.json", 1000, 24});
    ThreadPool pool(1);
    JobScheduler scheduler(pool);

    updater.Start(scheduler);
    for (int i = 0; i < 400 && store.Size() < 5; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(store.Size() == 5);
    for (int i = 0; i < 400 && scheduler.PendingCount() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    CHECK(scheduler.PendingCount() == 1); // next daily refresh

    scheduler.Cancel(RemoteDateUpdater::kJobName);
    updater.Stop();
    updater.Start(scheduler);
    CHECK(scheduler.PendingCount() == 0);
}

TEST_CASE("MetadataIndex refreshes, indexes and reloads metadata") {
    TempDir dir;
    DateCandidateStore store({"20200101"});
    FakeHttpClient http;
    MetadataIndex index(http, store, {dir.path() / "metadata", "", 1000, 7, 60});

    CHECK_FALSE(index.Lookup("1f600", "1f60e").has_value());
    CHECK(index.NeedsRefresh("1f600"));

    http.Set(UrlBuilder::MetadataUrl("", "1f600"), {200, kGrinData});
    REQUIRE(index.Refresh("1f600"));
    CHECK_FALSE(index.NeedsRefresh("1f600"));
    CHECK(index.Lookup("1f600", "1f60e") == std::optional<std::string>("20231029"));
    CHECK(index.Lookup("1f60e", "1f600") == std::optional<std::string>("20231029"));
    CHECK_FALSE(index.Lookup("1f600", "1f4a9").has_value());
    CHECK(store.Size() == 5);

    MetadataIndex reloaded(http, store, {dir.path() / "metadata", "", 1000, 7, 60});
    CHECK(reloaded.Load() == 1);
    CHECK(reloaded.Lookup("2764-fe0f", "1f600") == std::optional<std::string>("20220203"));
}

TEST_CASE("MetadataIndex backs off after a failed fetch") {
    TempDir dir;
    DateCandidateStore store;
    FakeHttpClient http;
    MetadataIndex index(http, store, {dir.path() / "metadata", "", 1000, 7, 60});

    CHECK_FALSE(index.Refresh("1f600"));
    CHECK(http.RequestCount() == 1);
    CHECK_FALSE(index.Refresh("1f600"));
    CHECK(http.RequestCount() == 1);

    CHECK_FALSE(index.Refresh("../etc/passwd"));
    CHECK(http.RequestCount() == 1);
}

TEST_CASE("MetadataIndex skips unreadable files on load") {
    TempDir dir;
    DateCandidateStore store;
    FakeHttpClient http;
    std::filesystem::create_directories(dir.path() / "metadata");
    REQUIRE(FileUtil::WriteFileAtomic(dir.path() / "metadata" / "1f600.json", kGrinData));
    REQUIRE(FileUtil::WriteFileAtomic(dir.path() / "metadata" / "1f60e.json", "{broken"));

    MetadataIndex index(http, store, {dir.path() / "metadata", "", 1000, 7, 60});
    CHECK(index.Load() == 1);
    CHECK(index.Lookup("1f600", "1f60e").has_value());
}

TEST_CASE("Resolver tries the metadata date before probing blindly") {
    TempDir dir;
    FakeClock clock;
    DateCandidateStore store({"20240101", "20231029", "20220101"});
    ProbeLimiter limiter(4);
    CacheStore cache(dir.path(), 7, clock.AsWallClock());
    ProbeTracker tracker(16, 7, clock.AsWallClock());
    KeyLocks locks;
    FakeHttpClient http;
    MetadataIndex index(http, store, {dir.path() / "metadata", "", 1000, 7, 60});
    Prober prober(http, limiter, store, cache, tracker, UrlBuilder::MakeProbeUrlBuilder("https://cdn.test", true),
                  ProberOptions{10, 1000, 1024 * 1024});
    Resolver resolver(prober, cache, locks, &index, ResolverOptions{true});

    http.Set(UrlBuilder::MetadataUrl("", "1f600"), {200, kGrinData});
    const auto hit = UrlBuilder::BuildProbeUrls("https://cdn.test", {"1f600", "1f60e"}, "20231029", false).front();
    http.Set(hit, {200, PngBytes("exact")});

    auto result = resolver.Resolve("1f600", "1f60e");
    REQUIRE(result.status == ResolveStatus::Image);
    CHECK(result.source_date == "20231029");
    CHECK(result.image == PngBytes("exact"));

    for (const auto& url : http.Requests()) {
        CHECK(url.find("/20240101/") == std::string::npos);
    }
    auto cached = cache.Get(result.key);
    REQUIRE(cached.has_value());
    CHECK(std::holds_alternative<FoundEntry>(*cached));
}

TEST_CASE("A metadata date that misses counts as probed and a hit clears progress") {
    TempDir dir;
    FakeClock clock;
    DateCandidateStore store({"20240101", "20231029", "20220101"});
    ProbeLimiter limiter(4);
    CacheStore cache(dir.path(), 7, clock.AsWallClock());
    ProbeTracker tracker(16, 7, clock.AsWallClock());
    KeyLocks locks;
    FakeHttpClient http;
    MetadataIndex index(http, store, {dir.path() / "metadata", "", 1000, 7, 60});
    Prober prober(http, limiter, store, cache, tracker, UrlBuilder::MakeProbeUrlBuilder("https://cdn.test", true),
                  ProberOptions{10, 1000, 1024 * 1024});
    Resolver resolver(prober, cache, locks, &index, ResolverOptions{true});
    http.Set(UrlBuilder::MetadataUrl("", "1f600"), {200, kGrinData});

    SECTION("the missing date is not requested again by the blind probe") {
        auto result = resolver.Resolve("1f600", "1f60e");
        CHECK(result.status == ResolveStatus::NoImage);

        size_t exact_requests = 0;
        for (const auto& url : http.Requests()) {
            if (url.find("/20231029/") != std::string::npos) ++exact_requests;
        }
        CHECK(exact_requests == 2); // both directions, once
        CHECK(cache.Get(result.key).has_value()); // every date answered 404
    }

    SECTION("a hit clears earlier progress") {
        const std::string key = MakePairKey({"1f600", "1f60e"}, true);
        tracker.Record(key, {"20240101"});
        const auto hit = UrlBuilder::BuildProbeUrls("https://cdn.test", {"1f600", "1f60e"}, "20231029", false).front();
        http.Set(hit, {200, PngBytes("exact")});

        auto result = resolver.Resolve("1f600", "1f60e");
        REQUIRE(result.status == ResolveStatus::Image);
        CHECK(result.source_date == "20231029");
        CHECK(tracker.Get(key).empty());
    }
}
