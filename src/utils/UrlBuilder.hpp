#pragma once
#include <string>
#include <vector>
#include "../core/KitchenTypes.hpp"

namespace EmojiKitchen {
namespace UrlBuilder {

// CDN host chosen by cdn_source: "www.gstatic.cn" (default), "www.gstatic.com" or "custom" (uses cdn_url).
// An empty source falls back to a non-empty cdn_url. No trailing slash.
std::string ResolveCdnUrl(const std::string& cdn_source, const std::string& cdn_url);

// GitHub proxy prefix chosen by github_proxy_source: "ghfast.top" (default), "gh-proxy.com",
// "custom" (uses github_proxy) or "none". Empty result means direct access.
std::string ResolveGithubProxy(const std::string& github_proxy_source, const std::string& github_proxy);

// "2764-fe0f" -> "u2764-ufe0f"
std::string CodepointToUrlSegment(const std::string& codepoint);

// {cdn}/android/keyboard/emojikitchen/{date}/{segA}/{segA}_{segB}.png, plus the B/A variant when both_directions.
std::vector<std::string> BuildProbeUrls(const std::string& cdn_base, const EmojiPair& pair, const std::string& date, bool both_directions);

ProbeUrlBuilder MakeProbeUrlBuilder(std::string cdn_base, bool both_directions);

// Raw file of the emoji-kitchen-backend repository, routed through the proxy when one is set.
std::string GithubRawUrl(const std::string& proxy, const std::string& repo_path);

// Document whose combinations list every generation date (the data file of 1f600).
std::string DatesDocumentUrl(const std::string& proxy);

// Combination metadata of a single emoji.
std::string MetadataUrl(const std::string& proxy, const std::string& codepoint);

}
}
