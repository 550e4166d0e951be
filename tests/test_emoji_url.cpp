#include <catch2/catch_all.hpp>
#include "core/KitchenTypes.hpp"
#include "utils/EmojiUtil.hpp"
#include "utils/UrlBuilder.hpp"

using namespace EmojiKitchen;

namespace {

std::optional<std::pair<std::string, std::string>> PairOf(const std::string& message) {
    auto pair = EmojiUtil::ExtractEmojiPair(message);
    if (!pair) return std::nullopt;
    return std::make_pair(EmojiUtil::ToCodepointString(pair->first), EmojiUtil::ToCodepointString(pair->second));
}

} // namespace

TEST_CASE("Two adjacent emoji are accepted") {
    auto p = PairOf("😀😎");
    REQUIRE(p.has_value());
    CHECK(p->first == "1f600");
    CHECK(p->second == "1f60e");
}

TEST_CASE("Surrounding whitespace is ignored") {
    auto p = PairOf("  \t😀😎 \n");
    REQUIRE(p.has_value());
    CHECK(p->first == "1f600");
}

TEST_CASE("Variation selectors, skin tones and ZWJ sequences stay with their emoji") {
    auto heart = PairOf("❤️😀");
    REQUIRE(heart.has_value());
    CHECK(heart->first == "2764-fe0f");
    CHECK(heart->second == "1f600");

    auto thumbs = PairOf("👍🏽😎");
    REQUIRE(thumbs.has_value());
    CHECK(thumbs->first == "1f44d-1f3fd");

    auto coder = PairOf("👩‍💻😀");
    REQUIRE(coder.has_value());
    CHECK(coder->first == "1f469-200d-1f4bb");
}

TEST_CASE("Messages that are not exactly two emoji are rejected") {
    CHECK_FALSE(PairOf("").has_value());
    CHECK_FALSE(PairOf("😀").has_value());
    CHECK_FALSE(PairOf("😀😎😀").has_value());
    CHECK_FALSE(PairOf("😀 😎").has_value());
    CHECK_FALSE(PairOf("hi 😀😎").has_value());
    CHECK_FALSE(PairOf("😀a😎").has_value());
    CHECK_FALSE(PairOf("hello world").has_value());
}

TEST_CASE("The same emoji twice is a valid pair") {
    auto p = PairOf("😀😀");
    REQUIRE(p.has_value());
    CHECK(p->first == p->second);
}

TEST_CASE("DecodeUtf8 replaces malformed input") {
    auto decoded = EmojiUtil::DecodeUtf8(std::string("a\xff" "b\xe2\x82", 5));
    REQUIRE(decoded.size() == 4);
    CHECK(decoded[0] == U'a');
    CHECK(decoded[1] == 0xFFFD);
    CHECK(decoded[2] == U'b');
    CHECK(decoded[3] == 0xFFFD);
}

TEST_CASE("IsExtendedPictographic") {
    CHECK(EmojiUtil::IsExtendedPictographic(0x1F600));
    CHECK(EmojiUtil::IsExtendedPictographic(0x2764));
    CHECK(EmojiUtil::IsExtendedPictographic(0x00A9));
    CHECK_FALSE(EmojiUtil::IsExtendedPictographic(U'A'));
    CHECK_FALSE(EmojiUtil::IsExtendedPictographic(0x1F3FB)); // skin tone modifier
    CHECK_FALSE(EmojiUtil::IsExtendedPictographic(0xFE0F));
}

TEST_CASE("Pair keys") {
    CHECK(MakePairKey({"1f60e", "1f600"}, true) == "1f600_1f60e");
    CHECK(MakePairKey({"1f600", "1f60e"}, true) == "1f600_1f60e");
    CHECK(MakePairKey({"1f60e", "1f600"}, false) == "1f60e_1f600");
    CHECK(MakePairKey({"1f600", "1f600"}, true) == "1f600_1f600");
}

TEST_CASE("IsCandidateDate") {
    CHECK(IsCandidateDate("20231029"));
    CHECK_FALSE(IsCandidateDate("2023-10-29"));
    CHECK_FALSE(IsCandidateDate("2023102"));
    CHECK_FALSE(IsCandidateDate("2023102a"));
}

TEST_CASE("CodepointToUrlSegment prefixes each codepoint") {
    CHECK(UrlBuilder::CodepointToUrlSegment("1f600") == "u1f600");
    CHECK(UrlBuilder::CodepointToUrlSegment("2764-fe0f") == "u2764-ufe0f");
    CHECK(UrlBuilder::CodepointToUrlSegment("1f469-200d-1f4bb") == "u1f469-u200d-u1f4bb");
}

TEST_CASE("BuildProbeUrls follows the CDN layout") {
    const EmojiPair pair{"1f600", "2764-fe0f"};
    auto one = UrlBuilder::BuildProbeUrls("https://www.gstatic.com", pair, "20231029", false);
    REQUIRE(one.size() == 1);
    CHECK(one[0] == "https://www.gstatic.com/android/keyboard/emojikitchen/20231029/u1f600/u1f600_u2764-ufe0f.png");

    auto both = UrlBuilder::BuildProbeUrls("https://www.gstatic.com", pair, "20231029", true);
    REQUIRE(both.size() == 2);
    CHECK(both[1] == "https://www.gstatic.com/android/keyboard/emojikitchen/20231029/u2764-ufe0f/u2764-ufe0f_u1f600.png");

    auto same = UrlBuilder::BuildProbeUrls("https://cdn", {"1f600", "1f600"}, "20231029", true);
    CHECK(same.size() == 1);

    auto builder = UrlBuilder::MakeProbeUrlBuilder("https://cdn", true);
    CHECK(builder(pair, "20220101").size() == 2);
}

TEST_CASE("CDN and proxy selection") {
    CHECK(UrlBuilder::ResolveCdnUrl("www.gstatic.cn", "") == "https://www.gstatic.cn");
    CHECK(UrlBuilder::ResolveCdnUrl("www.gstatic.com (global)", "") == "https://www.gstatic.com");
    CHECK(UrlBuilder::ResolveCdnUrl("custom", " https://mirror.example/ ") == "https://mirror.example");
    CHECK(UrlBuilder::ResolveCdnUrl("custom", "") == "https://www.gstatic.cn");
    CHECK(UrlBuilder::ResolveCdnUrl("", "https://mirror.example") == "https://mirror.example");

    CHECK(UrlBuilder::ResolveGithubProxy("ghfast.top", "") == "https://ghfast.top");
    CHECK(UrlBuilder::ResolveGithubProxy("gh-proxy.com", "") == "https://gh-proxy.com");
    CHECK(UrlBuilder::ResolveGithubProxy("none", "https://ignored") == "");
    CHECK(UrlBuilder::ResolveGithubProxy("custom", "https://proxy.example//") == "https://proxy.example");
}

TEST_CASE("GitHub URLs go through the proxy when one is set") {
    const std::string raw = "https://raw.githubusercontent.com/xsalazar/emoji-kitchen-backend/main/emoji/data/1f600.json";
    CHECK(UrlBuilder::DatesDocumentUrl("") == raw);
    CHECK(UrlBuilder::DatesDocumentUrl("https://ghfast.top") == "https://ghfast.top/" + raw);
    CHECK(UrlBuilder::MetadataUrl("", "2764-fe0f") ==
          "https://raw.githubusercontent.com/xsalazar/emoji-kitchen-backend/main/emoji/data/2764-fe0f.json");
}
