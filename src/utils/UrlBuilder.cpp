#include "UrlBuilder.hpp"
#include <algorithm>

namespace EmojiKitchen {
namespace UrlBuilder {

namespace {

constexpr const char* kDefaultCdn = "https://www.gstatic.cn";
constexpr const char* kDefaultProxy = "https://ghfast.top";
constexpr const char* kRawBase = "https://raw.githubusercontent.com/xsalazar/emoji-kitchen-backend/main/";

inline bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Trim whitespace and trailing slashes.
inline std::string CleanBase(std::string s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    s = s.substr(b, s.find_last_not_of(ws) - b + 1);
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

} // anonymous namespace

std::string ResolveCdnUrl(const std::string& cdn_source, const std::string& cdn_url) {
    if (StartsWith(cdn_source, "www.gstatic.cn")) return "https://www.gstatic.cn";
    if (StartsWith(cdn_source, "www.gstatic.com")) return "https://www.gstatic.com";
    if (cdn_source == "custom" || cdn_source.empty()) {
        auto custom = CleanBase(cdn_url);
        if (!custom.empty()) return custom;
    }
    return kDefaultCdn;
}

std::string ResolveGithubProxy(const std::string& github_proxy_source, const std::string& github_proxy) {
    if (StartsWith(github_proxy_source, "ghfast.top")) return "https://ghfast.top";
    if (StartsWith(github_proxy_source, "gh-proxy.com")) return "https://gh-proxy.com";
    if (github_proxy_source == "none") return "";
    if (github_proxy_source == "custom" || github_proxy_source.empty()) {
        auto custom = CleanBase(github_proxy);
        if (!custom.empty()) return custom;
    }
    return kDefaultProxy;
}

std::string CodepointToUrlSegment(const std::string& codepoint) {
    std::string out;
    out.reserve(codepoint.size() + 4);
    size_t start = 0;
    while (true) {
        auto dash = codepoint.find('-', start);
        if (!out.empty()) out.push_back('-');
        out.push_back('u');
        out += codepoint.substr(start, dash == std::string::npos ? std::string::npos : dash - start);
        if (dash == std::string::npos) break;
        start = dash + 1;
    }
    return out;
}

std::vector<std::string> BuildProbeUrls(const std::string& cdn_base, const EmojiPair& pair, const std::string& date, bool both_directions) {
    const std::string a = CodepointToUrlSegment(pair.first);
    const std::string b = CodepointToUrlSegment(pair.second);
    const std::string prefix = cdn_base + "/android/keyboard/emojikitchen/" + date + "/";

    std::vector<std::string> urls;
    urls.push_back(prefix + a + "/" + a + "_" + b + ".png");
    if (both_directions && a != b) {
        urls.push_back(prefix + b + "/" + b + "_" + a + ".png");
    }
    return urls;
}

ProbeUrlBuilder MakeProbeUrlBuilder(std::string cdn_base, bool both_directions) {
    return [cdn_base = std::move(cdn_base), both_directions](const EmojiPair& pair, const std::string& date) {
        return BuildProbeUrls(cdn_base, pair, date, both_directions);
    };
}

std::string GithubRawUrl(const std::string& proxy, const std::string& repo_path) {
    std::string raw = std::string(kRawBase) + repo_path;
    if (proxy.empty()) return raw;
    return proxy + "/" + raw;
}

std::string DatesDocumentUrl(const std::string& proxy) {
    return GithubRawUrl(proxy, "emoji/data/1f600.json");
}

std::string MetadataUrl(const std::string& proxy, const std::string& codepoint) {
    return GithubRawUrl(proxy, "emoji/data/" + codepoint + ".json");
}

}
}
