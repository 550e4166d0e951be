#include <catch2/catch_all.hpp>
#include "TestSupport.hpp"
#include "utils/ReplyBuilder.hpp"

using namespace EmojiKitchen;
using namespace EmojiKitchen::Testing;

TEST_CASE("Image reply attaches the PNG and references the request") {
    const std::string image = PngBytes("pixels");
    dpp::message m = BuildImageReply(dpp::snowflake(111), dpp::snowflake(222), "1f600_1f60e", image);

    CHECK(m.channel_id == dpp::snowflake(111));
    CHECK(m.content.empty());
    REQUIRE(m.file_data.size() == 1);
    CHECK(m.file_data[0].name == "emoji_kitchen_1f600_1f60e.png");
    CHECK(m.file_data[0].content == image);
    CHECK(m.file_data[0].mimetype == "image/png");
    CHECK(m.message_reference.message_id == dpp::snowflake(222));
}

TEST_CASE("Image reply without a message to answer") {
    dpp::message m = BuildImageReply(dpp::snowflake(111), dpp::snowflake(0), "1f600_1f600", PngBytes("x"));
    CHECK(m.message_reference.message_id == dpp::snowflake(0));
    CHECK(ReplyFileName("2764-fe0f_1f600") == "emoji_kitchen_2764-fe0f_1f600.png");
}
