#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace EmojiKitchen {
    struct Config {
        std::string bot_token = "YOUR_BOT_TOKEN_HERE";
        std::string log_level = "info";
        int log_retention_days = 14;
        std::string data_dir = "data"; // relative paths are resolved against the executable directory
        int max_concurrency = 0;       // worker threads; 0 = half of the system cores
        double rate_per_sec = 2.0;     // resolutions started per second, across all channels
        long http_max_redirects = 5;
        std::string http_user_agent = "EmojiKitchenBot/1.0";

        // CDN and GitHub proxy selection
        std::string cdn_source = "www.gstatic.cn";
        std::string cdn_url;
        std::string github_proxy_source = "ghfast.top";
        std::string github_proxy;

        // Candidate dates and probing
        std::string extra_dates;       // newline separated YYYYMMDD
        int notfound_expire_days = 7;
        int request_timeout = 10;      // seconds
        int max_probe_dates = 10;
        int max_concurrent_probes = 4;
        int date_refresh_hours = 24;
        int metadata_expire_days = 7;
        bool use_metadata_index = true;
        bool pair_order_insensitive = true;
        size_t max_image_bytes = 4194304; // 4MB

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        void Load(const std::string& path);
        void CreateDefault(const std::string& path);
    };
}
