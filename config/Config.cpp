#include "Config.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>

namespace EmojiKitchen {

namespace {

nlohmann::json ToJson(const Config& c) {
    nlohmann::json data;
    data["bot_token"] = c.bot_token;
    data["log_level"] = c.log_level;
    data["log_retention_days"] = c.log_retention_days;
    data["data_dir"] = c.data_dir;
    data["max_concurrency"] = c.max_concurrency;
    data["rate_per_sec"] = c.rate_per_sec;
    data["http_max_redirects"] = c.http_max_redirects;
    data["http_user_agent"] = c.http_user_agent;
    data["cdn_source"] = c.cdn_source;
    data["cdn_url"] = c.cdn_url;
    data["github_proxy_source"] = c.github_proxy_source;
    data["github_proxy"] = c.github_proxy;
    data["extra_dates"] = c.extra_dates;
    data["notfound_expire_days"] = c.notfound_expire_days;
    data["request_timeout"] = c.request_timeout;
    data["max_probe_dates"] = c.max_probe_dates;
    data["max_concurrent_probes"] = c.max_concurrent_probes;
    data["date_refresh_hours"] = c.date_refresh_hours;
    data["metadata_expire_days"] = c.metadata_expire_days;
    data["use_metadata_index"] = c.use_metadata_index;
    data["pair_order_insensitive"] = c.pair_order_insensitive;
    data["max_image_bytes"] = c.max_image_bytes;
    return data;
}

// Integer settings are sometimes written as strings by hand; anything unusable keeps the default.
int IntValue(const nlohmann::json& data, const char* key, int fallback) {
    auto it = data.find(key);
    if (it == data.end()) return fallback;
    if (it->is_number_integer()) return it->get<int>();
    if (it->is_number()) return static_cast<int>(it->get<double>());
    if (it->is_string()) {
        try {
            return std::stoi(it->get<std::string>());
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

// A value of the wrong JSON type keeps the default instead of failing the whole load.
template <typename T>
T TypedValue(const nlohmann::json& data, const char* key, const T& fallback) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) return fallback;
    try {
        return it->get<T>();
    } catch (const nlohmann::json::type_error&) {
        return fallback;
    }
}

} // anonymous namespace

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in config file " + path + ": " + e.what());
    }
    if (!data.is_object()) {
        throw std::runtime_error("Config file " + path + " must contain a JSON object");
    }

    const Config defaults;
    bot_token = TypedValue(data, "bot_token", defaults.bot_token);
    log_level = TypedValue(data, "log_level", defaults.log_level);
    log_retention_days = IntValue(data, "log_retention_days", defaults.log_retention_days);
    data_dir = TypedValue(data, "data_dir", defaults.data_dir);
    max_concurrency = IntValue(data, "max_concurrency", defaults.max_concurrency);
    rate_per_sec = TypedValue(data, "rate_per_sec", defaults.rate_per_sec);
    http_max_redirects = TypedValue(data, "http_max_redirects", defaults.http_max_redirects);
    http_user_agent = TypedValue(data, "http_user_agent", defaults.http_user_agent);
    cdn_source = TypedValue(data, "cdn_source", defaults.cdn_source);
    cdn_url = TypedValue(data, "cdn_url", defaults.cdn_url);
    github_proxy_source = TypedValue(data, "github_proxy_source", defaults.github_proxy_source);
    github_proxy = TypedValue(data, "github_proxy", defaults.github_proxy);
    extra_dates = TypedValue(data, "extra_dates", defaults.extra_dates);
    notfound_expire_days = IntValue(data, "notfound_expire_days", defaults.notfound_expire_days);
    request_timeout = IntValue(data, "request_timeout", defaults.request_timeout);
    max_probe_dates = IntValue(data, "max_probe_dates", defaults.max_probe_dates);
    max_concurrent_probes = IntValue(data, "max_concurrent_probes", defaults.max_concurrent_probes);
    date_refresh_hours = IntValue(data, "date_refresh_hours", defaults.date_refresh_hours);
    metadata_expire_days = IntValue(data, "metadata_expire_days", defaults.metadata_expire_days);
    use_metadata_index = TypedValue(data, "use_metadata_index", defaults.use_metadata_index);
    pair_order_insensitive = TypedValue(data, "pair_order_insensitive", defaults.pair_order_insensitive);
    const long long image_bytes = TypedValue<long long>(data, "max_image_bytes", static_cast<long long>(defaults.max_image_bytes));
    max_image_bytes = image_bytes > 0 ? static_cast<size_t>(image_bytes) : defaults.max_image_bytes;

    // Values that would stall probing fall back to their defaults.
    if (request_timeout <= 0) request_timeout = defaults.request_timeout;
    if (max_probe_dates <= 0) max_probe_dates = defaults.max_probe_dates;
    if (max_concurrent_probes <= 0) max_concurrent_probes = defaults.max_concurrent_probes;
    if (notfound_expire_days < 0) notfound_expire_days = defaults.notfound_expire_days;

    // Write back missing keys so existing config.json reflects newly added options.
    // This is non-destructive: preserves unknown keys and only appends missing ones.
    bool changed = false;
    const nlohmann::json current = ToJson(*this);
    for (auto it = current.begin(); it != current.end(); ++it) {
        if (!data.contains(it.key())) { data[it.key()] = it.value(); changed = true; }
    }

    if (changed) {
        std::filesystem::path p(path);
        std::filesystem::path bak = p;
        bak += ".bak";
        std::error_code ec;
        std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
        (void)ec; // best-effort backup

        // A read-only config must not prevent startup.
        std::ofstream o(path, std::ios::trunc);
        if (o.is_open()) {
            o << std::setw(4) << data << std::endl;
        }
    }
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    const Config defaultConfig;
    nlohmann::json data = ToJson(defaultConfig);

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << data << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

}
