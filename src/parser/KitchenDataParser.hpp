#pragma once
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace EmojiKitchen {
    // What one emoji-kitchen-backend data file (emoji/data/{cp}.json) tells us.
    struct KitchenMetadata {
        std::set<std::string> dates;                                  // every generation date mentioned
        std::unordered_map<std::string, std::string> partner_dates;   // partner codepoint -> date to use
    };

    class KitchenDataParser {
    public:
        // Reads "combinations": { partner: [ {date, isLatest, ...}, ... ] }.
        // The isLatest entry wins for a partner, otherwise the first one. nullopt if the text is not JSON.
        static std::optional<KitchenMetadata> Parse(const std::string& json_text);

        // Accepts either a plain JSON array of date strings or a data file as above.
        // Only 8-digit dates are kept. nullopt if the text is neither.
        static std::optional<std::set<std::string>> ParseDateList(const std::string& json_text);
    };
}
