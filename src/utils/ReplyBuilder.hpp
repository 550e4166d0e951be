#pragma once
#include <string>
#include <dpp/dpp.h>

namespace EmojiKitchen {

// "emoji_kitchen_1f600_1f60e.png"
std::string ReplyFileName(const std::string& pair_key);

// Reply to the triggering message carrying the composite image as an attachment.
dpp::message BuildImageReply(dpp::snowflake channel_id, dpp::snowflake reply_to, const std::string& pair_key, const std::string& image);

}
