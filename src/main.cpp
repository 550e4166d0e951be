#include <dpp/dpp.h>
#include <iostream>
#include <cstdlib>
#include <curl/curl.h>
#include <filesystem>
#include <algorithm>
#include <memory>
#include "../config/Config.hpp"
#include "core/KitchenHandler.hpp"
#include "core/DateCandidateStore.hpp"
#include "core/RemoteDateUpdater.hpp"
#include "core/MetadataIndex.hpp"
#include "core/Prober.hpp"
#include "core/Resolver.hpp"
#include "core/JobScheduler.hpp"
#include "cache/CacheStore.hpp"
#include "cache/ProbeTracker.hpp"
#include "network/HttpClient.hpp"
#include "utils/Logger.hpp"
#include "utils/ThreadPool.hpp"
#include "utils/RateLimiter.hpp"
#include "utils/ProbeLimiter.hpp"
#include "utils/KeyLocks.hpp"
#include "utils/UrlBuilder.hpp"

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    std::filesystem::path exe_path(argv[0]);
    std::filesystem::path exe_dir = exe_path.parent_path();
    std::filesystem::path config_path = exe_dir / "config" / "config.json";
    const std::string config_path_str = config_path.string();

    // Initialize global resources
    curl_global_init(CURL_GLOBAL_ALL);

    // Load Config
    try {
        EmojiKitchen::Config::GetInstance().Load(config_path_str);
        EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Info, "Configuration loaded from: " + config_path_str);
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") != std::string::npos) {
            EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path_str);
            try {
                EmojiKitchen::Config::GetInstance().CreateDefault(config_path_str);
                EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Info, "Default config.json created. Please review it, set your bot token, and restart the bot.");
                curl_global_cleanup();
                return 0;
            } catch (const std::exception& create_e) {
                EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Error, "Failed to create default config: " + std::string(create_e.what()));
                curl_global_cleanup();
                return 1;
            }
        } else {
            EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Error, "Failed to load config: " + error_message);
            curl_global_cleanup();
            return 1;
        }
    } catch (const nlohmann::json::exception& e) {
        EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Error, "Failed to load config: " + std::string(e.what()));
        curl_global_cleanup();
        return 1;
    }
    const auto& config = EmojiKitchen::Config::GetInstance();

    std::filesystem::path data_dir(config.data_dir);
    if (data_dir.is_relative()) data_dir = exe_dir / data_dir;
    EmojiKitchen::Logger::Init(data_dir.string(), EmojiKitchen::Logger::FromString(config.log_level), config.log_retention_days);

    // Determine thread pool size
    const unsigned int hardware_cores = std::max(1u, std::thread::hardware_concurrency());
    const unsigned int default_threads = std::max(1u, hardware_cores / 2);
    unsigned int worker_threads = 0;

    if (config.max_concurrency == 0) {
        worker_threads = default_threads;
        EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Info, "max_concurrency is 0, defaulting to half of system cores: " + std::to_string(worker_threads));
    } else if (config.max_concurrency < 0 || static_cast<unsigned int>(config.max_concurrency) > hardware_cores) {
        EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Error, "Configured max_concurrency (" + std::to_string(config.max_concurrency) + ") is invalid. It must be between 1 and the number of system cores (" + std::to_string(hardware_cores) + ").");
        curl_global_cleanup();
        return 1;
    } else {
        worker_threads = config.max_concurrency;
        EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Info, "Using configured max_concurrency: " + std::to_string(worker_threads));
    }

    // Get Bot Token
    if (config.bot_token == "YOUR_BOT_TOKEN_HERE" || config.bot_token.empty()) {
        EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Error, "Please set your bot_token in " + config_path_str);
        curl_global_cleanup();
        return 1;
    }

    int exit_code = 0;
    {
        // Setup Bot
        dpp::cluster bot(config.bot_token, dpp::i_default_intents | dpp::i_message_content);
        bot.on_log([](const dpp::log_t& event) {
            EmojiKitchen::LogLevel level = EmojiKitchen::LogLevel::Debug;
            if (event.severity > dpp::ll_debug) {
                switch (event.severity) {
                    case dpp::ll_info:    level = EmojiKitchen::LogLevel::Info; break;
                    case dpp::ll_warning: level = EmojiKitchen::LogLevel::Warn; break;
                    case dpp::ll_error:
                    case dpp::ll_critical:level = EmojiKitchen::LogLevel::Error; break;
                    default:              level = EmojiKitchen::LogLevel::Debug; break;
                }
            }
            EmojiKitchen::Logger::Log(level, "[DPP] " + event.message);
        });

        const std::string cdn_url = EmojiKitchen::UrlBuilder::ResolveCdnUrl(config.cdn_source, config.cdn_url);
        const std::string github_proxy = EmojiKitchen::UrlBuilder::ResolveGithubProxy(config.github_proxy_source, config.github_proxy);
        const long timeout_ms = static_cast<long>(config.request_timeout) * 1000;
        EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Info, "CDN: " + cdn_url + ", GitHub proxy: " + (github_proxy.empty() ? std::string("none") : github_proxy));

        // Setup Core Components
        // Shared state is declared before the HTTP client, and the client before the thread pool,
        // so in-flight callbacks and pooled resolutions never outlive what they touch.
        EmojiKitchen::ProbeLimiter probe_limiter(static_cast<size_t>(config.max_concurrent_probes));
        EmojiKitchen::DateCandidateStore date_store;
        const size_t extra = date_store.Merge(EmojiKitchen::DateCandidateStore::ParseDateLines(config.extra_dates));
        if (extra > 0) {
            EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Info, "Added " + std::to_string(extra) + " dates from extra_dates");
        }

        std::unique_ptr<EmojiKitchen::CacheStore> cache_store;
        try {
            cache_store = std::make_unique<EmojiKitchen::CacheStore>(data_dir, config.notfound_expire_days);
        } catch (const std::exception& e) {
            EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Error, std::string("Failed to open cache: ") + e.what());
            curl_global_cleanup();
            return 1;
        }
        EmojiKitchen::ProbeTracker probe_tracker(1024, config.notfound_expire_days);
        EmojiKitchen::KeyLocks key_locks(1024);
        EmojiKitchen::HttpClient http_client;

        EmojiKitchen::RemoteDateUpdater date_updater(http_client, date_store, {
            EmojiKitchen::UrlBuilder::DatesDocumentUrl(github_proxy),
            data_dir / "dates_cache.json",
            timeout_ms,
            config.date_refresh_hours,
        });
        date_updater.LoadCachedDates();

        std::unique_ptr<EmojiKitchen::MetadataIndex> metadata_index;
        if (config.use_metadata_index) {
            EmojiKitchen::MetadataIndexOptions metadata_options;
            metadata_options.dir = data_dir / "metadata";
            metadata_options.github_proxy = github_proxy;
            metadata_options.timeout_ms = timeout_ms;
            metadata_options.expire_days = config.metadata_expire_days;
            metadata_index = std::make_unique<EmojiKitchen::MetadataIndex>(http_client, date_store, metadata_options);
            const size_t indexed = metadata_index->Load();
            EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Info, "Metadata index loaded for " + std::to_string(indexed) + " emoji");
        }

        EmojiKitchen::ProberOptions prober_options;
        prober_options.max_probe_dates = static_cast<size_t>(config.max_probe_dates);
        prober_options.request_timeout_ms = timeout_ms;
        prober_options.max_image_bytes = config.max_image_bytes;
        EmojiKitchen::Prober prober(http_client, probe_limiter, date_store, *cache_store, probe_tracker,
            EmojiKitchen::UrlBuilder::MakeProbeUrlBuilder(cdn_url, config.pair_order_insensitive), prober_options);
        EmojiKitchen::Resolver resolver(prober, *cache_store, key_locks, metadata_index.get(), {config.pair_order_insensitive});

        EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Info, "Candidate dates: " + std::to_string(date_store.Size()));

        EmojiKitchen::ThreadPool thread_pool(worker_threads);
        EmojiKitchen::JobScheduler job_scheduler(thread_pool);
        EmojiKitchen::RateLimiter rate_limiter(config.rate_per_sec);
        EmojiKitchen::KitchenHandler handler(bot, thread_pool, rate_limiter, resolver);

        date_updater.Start(job_scheduler);

        // Register Event Handlers
        bot.on_message_create([&handler](const dpp::message_create_t& event) {
            handler.OnMessageCreate(event);
        });

        bot.on_ready([&bot](const dpp::ready_t& event) {
            EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Info, "Bot is ready! Logged in as " + bot.me.username);
        });

        // Start Bot
        try {
            bot.start(dpp::st_wait);
        } catch (const dpp::exception& e) {
            EmojiKitchen::Logger::Log(EmojiKitchen::LogLevel::Error, "DPP Exception: " + std::string(e.what()));
            exit_code = 1;
        }

        // A refresh still running on the pool outlives job_scheduler; it must not re-arm into it.
        date_updater.Stop();
        job_scheduler.Cancel(EmojiKitchen::RemoteDateUpdater::kJobName);
    }

    // Cleanup global resources once every curl handle is gone
    curl_global_cleanup();
    return exit_code;
}
