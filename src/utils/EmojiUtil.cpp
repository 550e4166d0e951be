#include "EmojiUtil.hpp"
#include <algorithm>
#include <cstdio>

namespace EmojiKitchen {
namespace EmojiUtil {

namespace {

struct Range {
    char32_t first;
    char32_t last;
};

// Extended_Pictographic (Unicode 15 emoji-data.txt), merged into contiguous ranges.
constexpr Range kPictographic[] = {
    {0x00A9, 0x00A9}, {0x00AE, 0x00AE}, {0x203C, 0x203C}, {0x2049, 0x2049},
    {0x2122, 0x2122}, {0x2139, 0x2139}, {0x2194, 0x2199}, {0x21A9, 0x21AA},
    {0x231A, 0x231B}, {0x2328, 0x2328}, {0x2388, 0x2388}, {0x23CF, 0x23CF},
    {0x23E9, 0x23F3}, {0x23F8, 0x23FA}, {0x24C2, 0x24C2}, {0x25AA, 0x25AB},
    {0x25B6, 0x25B6}, {0x25C0, 0x25C0}, {0x25FB, 0x25FE}, {0x2600, 0x2605},
    {0x2607, 0x2612}, {0x2614, 0x2685}, {0x2690, 0x2705}, {0x2708, 0x2712},
    {0x2714, 0x2714}, {0x2716, 0x2716}, {0x271D, 0x271D}, {0x2721, 0x2721},
    {0x2728, 0x2728}, {0x2733, 0x2734}, {0x2744, 0x2744}, {0x2747, 0x2747},
    {0x274C, 0x274C}, {0x274E, 0x274E}, {0x2753, 0x2755}, {0x2757, 0x2757},
    {0x2763, 0x2767}, {0x2795, 0x2797}, {0x27A1, 0x27A1}, {0x27B0, 0x27B0},
    {0x27BF, 0x27BF}, {0x2934, 0x2935}, {0x2B05, 0x2B07}, {0x2B1B, 0x2B1C},
    {0x2B50, 0x2B50}, {0x2B55, 0x2B55}, {0x3030, 0x3030}, {0x303D, 0x303D},
    {0x3297, 0x3297}, {0x3299, 0x3299}, {0x1F000, 0x1F0FF}, {0x1F10D, 0x1F10F},
    {0x1F12F, 0x1F12F}, {0x1F16C, 0x1F171}, {0x1F17E, 0x1F17F}, {0x1F18E, 0x1F18E},
    {0x1F191, 0x1F19A}, {0x1F1AD, 0x1F1E5}, {0x1F201, 0x1F20F}, {0x1F21A, 0x1F21A},
    {0x1F22F, 0x1F22F}, {0x1F232, 0x1F23A}, {0x1F23C, 0x1F23F}, {0x1F249, 0x1F3FA},
    {0x1F400, 0x1F53D}, {0x1F546, 0x1F64F}, {0x1F680, 0x1F6FF}, {0x1F774, 0x1F77F},
    {0x1F7D5, 0x1F7FF}, {0x1F80C, 0x1F80F}, {0x1F848, 0x1F84F}, {0x1F85A, 0x1F85F},
    {0x1F888, 0x1F88F}, {0x1F8AE, 0x1F8FF}, {0x1F90C, 0x1F93A}, {0x1F93C, 0x1F945},
    {0x1F947, 0x1FAFF}, {0x1FC00, 0x1FFFD},
};

constexpr char32_t kZwj = 0x200D;
constexpr char32_t kReplacement = 0xFFFD;

inline bool IsVariationSelector(char32_t cp) { return cp == 0xFE0F || cp == 0xFE0E; }
inline bool IsSkinTone(char32_t cp) { return cp >= 0x1F3FB && cp <= 0x1F3FF; }

// Consumes one pictographic element plus its modifiers starting at pos. Returns the end position, or pos if none.
size_t MatchElement(const std::u32string& s, size_t pos) {
    if (pos >= s.size() || !IsExtendedPictographic(s[pos])) return pos;
    size_t i = pos + 1;
    if (i < s.size() && IsVariationSelector(s[i])) ++i;
    if (i < s.size() && IsSkinTone(s[i])) ++i;
    return i;
}

inline std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

} // anonymous namespace

std::u32string DecodeUtf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = 0;
        char32_t cp = 0;
        if (c < 0x80) { cp = c; len = 1; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; len = 2; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; len = 3; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; len = 4; }
        else { out.push_back(kReplacement); ++i; continue; }

        if (i + len > n) { out.push_back(kReplacement); break; }
        bool ok = true;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) { ok = false; break; }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!ok || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            out.push_back(kReplacement);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

bool IsExtendedPictographic(char32_t cp) {
    auto it = std::upper_bound(std::begin(kPictographic), std::end(kPictographic), cp,
        [](char32_t v, const Range& r) { return v < r.first; });
    if (it == std::begin(kPictographic)) return false;
    --it;
    return cp <= it->last;
}

std::vector<std::u32string> ExtractEmojis(const std::u32string& text) {
    std::vector<std::u32string> result;
    size_t i = 0;
    while (i < text.size()) {
        size_t end = MatchElement(text, i);
        if (end == i) { ++i; continue; }
        while (end + 1 < text.size() && text[end] == kZwj) {
            size_t next = MatchElement(text, end + 1);
            if (next == end + 1) break;
            end = next;
        }
        result.push_back(text.substr(i, end - i));
        i = end;
    }
    return result;
}

std::optional<std::pair<std::u32string, std::u32string>> ExtractEmojiPair(const std::string& message) {
    const std::u32string text = DecodeUtf8(Trim(message));
    if (text.empty()) return std::nullopt;

    auto emojis = ExtractEmojis(text);
    if (emojis.size() != 2) return std::nullopt;
    if (emojis[0] + emojis[1] != text) return std::nullopt;
    return std::make_pair(std::move(emojis[0]), std::move(emojis[1]));
}

std::string ToCodepointString(const std::u32string& emoji) {
    std::string out;
    char buf[16];
    for (char32_t cp : emoji) {
        if (!out.empty()) out.push_back('-');
        std::snprintf(buf, sizeof(buf), "%x", static_cast<unsigned>(cp));
        out += buf;
    }
    return out;
}

}
}
