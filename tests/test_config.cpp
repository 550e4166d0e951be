#include <catch2/catch_all.hpp>
#include <fstream>
#include <nlohmann/json.hpp>
#include "TestSupport.hpp"
#include "config/Config.hpp"
#include "utils/FileUtil.hpp"

using namespace EmojiKitchen;
using namespace EmojiKitchen::Testing;

TEST_CASE("Config fills defaults and writes missing keys back") {
    TempDir dir;
    const auto path = (dir.path() / "config.json").string();
    {
        std::ofstream o(path);
        o << R"({"bot_token": "abc", "max_probe_dates": "5", "request_timeout": 0, "custom_key": 1})";
    }

    Config config;
    config.Load(path);
    CHECK(config.bot_token == "abc");
    CHECK(config.max_probe_dates == 5);       // numeric strings are accepted
    CHECK(config.request_timeout == 10);      // unusable values fall back
    CHECK(config.max_concurrent_probes == 4);
    CHECK(config.notfound_expire_days == 7);
    CHECK(config.pair_order_insensitive);

    auto written = FileUtil::ReadFile(path);
    REQUIRE(written.has_value());
    auto json = nlohmann::json::parse(*written);
    CHECK(json.contains("cdn_source"));
    CHECK(json.contains("use_metadata_index"));
    CHECK(json["custom_key"] == 1);
    CHECK(std::filesystem::exists(path + ".bak"));
}

TEST_CASE("Config rejects missing and malformed files") {
    TempDir dir;
    Config config;
    CHECK_THROWS_AS(config.Load((dir.path() / "absent.json").string()), std::runtime_error);

    const auto path = (dir.path() / "broken.json").string();
    {
        std::ofstream o(path);
        o << "{ not json";
    }
    CHECK_THROWS_AS(config.Load(path), std::runtime_error);
}

TEST_CASE("Config default file round-trips") {
    TempDir dir;
    const auto path = (dir.path() / "sub" / "config.json").string();
    Config().CreateDefault(path);

    Config config;
    config.Load(path);
    CHECK(config.bot_token == Config().bot_token);
    CHECK(config.cdn_source == "www.gstatic.cn");
    CHECK_FALSE(std::filesystem::exists(path + ".bak")); // nothing was missing
}

TEST_CASE("Config keeps defaults for values of the wrong type") {
    TempDir dir;
    const auto path = (dir.path() / "config.json").string();
    {
        std::ofstream o(path);
        o << R"({"bot_token": 5, "use_metadata_index": "yes", "pair_order_insensitive": 0,)"
             R"( "rate_per_sec": "fast", "extra_dates": ["20250101", 7], "max_image_bytes": -1,)"
             R"( "cdn_source": null, "http_max_redirects": "ten"})";
    }

    Config config;
    REQUIRE_NOTHROW(config.Load(path));
    const Config defaults;
    CHECK(config.bot_token == defaults.bot_token);
    CHECK(config.use_metadata_index == defaults.use_metadata_index);
    CHECK(config.pair_order_insensitive == defaults.pair_order_insensitive);
    CHECK(config.rate_per_sec == defaults.rate_per_sec);
    CHECK(config.extra_dates == defaults.extra_dates);
    CHECK(config.max_image_bytes == defaults.max_image_bytes);
    CHECK(config.cdn_source == defaults.cdn_source);
    CHECK(config.http_max_redirects == defaults.http_max_redirects);
}
