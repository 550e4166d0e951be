#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace EmojiKitchen {

    // Two emoji as codepoint strings ("1f600", "2764-fe0f"), in the order the user sent them.
    struct EmojiPair {
        std::string first;
        std::string second;
    };

    // Cache and lock key for a pair. When the CDN serves both orders the key is order-independent.
    inline std::string MakePairKey(const EmojiPair& pair, bool order_insensitive) {
        if (order_insensitive && pair.second < pair.first) {
            return pair.second + "_" + pair.first;
        }
        return pair.first + "_" + pair.second;
    }

    // Every URL that may hold the image for (pair, date). A date has no image only if all of them 404.
    using ProbeUrlBuilder = std::function<std::vector<std::string>(const EmojiPair& pair, const std::string& date)>;

    // Candidate generation dates are 8 ASCII digits, YYYYMMDD.
    inline bool IsCandidateDate(const std::string& s) {
        if (s.size() != 8) return false;
        for (char c : s) {
            if (c < '0' || c > '9') return false;
        }
        return true;
    }

}
