#include "KitchenDataParser.hpp"
#include <nlohmann/json.hpp>
#include "../core/KitchenTypes.hpp"

namespace {

using nlohmann::json;

void CollectCombinations(const json& data, EmojiKitchen::KitchenMetadata& meta) {
    if (!data.is_object()) return;
    auto combos = data.find("combinations");
    if (combos == data.end() || !combos->is_object()) return;

    for (auto it = combos->begin(); it != combos->end(); ++it) {
        const json& list = it.value();
        if (!list.is_array() || list.empty()) continue;

        const json* chosen = nullptr;
        for (const auto& item : list) {
            if (!item.is_object()) continue;
            auto date = item.find("date");
            if (date != item.end() && date->is_string() && EmojiKitchen::IsCandidateDate(date->get<std::string>())) {
                meta.dates.insert(date->get<std::string>());
            }
            auto latest = item.find("isLatest");
            if (!chosen && latest != item.end() && latest->is_boolean() && latest->get<bool>()) {
                chosen = &item;
            }
        }
        if (!chosen && list.front().is_object()) chosen = &list.front();
        if (!chosen) continue;

        auto date = chosen->find("date");
        if (date != chosen->end() && date->is_string() && !date->get<std::string>().empty()) {
            meta.partner_dates[it.key()] = date->get<std::string>();
        }
    }
}

} // anonymous namespace

namespace EmojiKitchen {

std::optional<KitchenMetadata> KitchenDataParser::Parse(const std::string& json_text) {
    json data = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
    if (data.is_discarded()) return std::nullopt;

    KitchenMetadata meta;
    CollectCombinations(data, meta);
    return meta;
}

std::optional<std::set<std::string>> KitchenDataParser::ParseDateList(const std::string& json_text) {
    json data = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
    if (data.is_discarded()) return std::nullopt;

    if (data.is_array()) {
        std::set<std::string> dates;
        for (const auto& v : data) {
            if (v.is_string() && IsCandidateDate(v.get<std::string>())) dates.insert(v.get<std::string>());
        }
        return dates;
    }
    if (data.is_object() && data.contains("combinations")) {
        KitchenMetadata meta;
        CollectCombinations(data, meta);
        return meta.dates;
    }
    return std::nullopt;
}

}
