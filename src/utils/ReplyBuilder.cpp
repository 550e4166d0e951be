#include "ReplyBuilder.hpp"

namespace EmojiKitchen {

std::string ReplyFileName(const std::string& pair_key) {
    return "emoji_kitchen_" + pair_key + ".png";
}

dpp::message BuildImageReply(dpp::snowflake channel_id, dpp::snowflake reply_to, const std::string& pair_key, const std::string& image) {
    dpp::message m(channel_id, "");
    m.add_file(ReplyFileName(pair_key), image, "image/png");
    if (reply_to) {
        m.set_reference(reply_to);
    }
    return m;
}

}
