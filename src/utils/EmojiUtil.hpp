#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace EmojiKitchen {
namespace EmojiUtil {

// Decodes UTF-8. Malformed sequences become U+FFFD.
std::u32string DecodeUtf8(const std::string& text);

bool IsExtendedPictographic(char32_t cp);

// Finds emoji sequences: a pictographic codepoint, an optional variation selector (FE0E/FE0F),
// an optional skin tone modifier, and any number of ZWJ-joined continuations of the same shape.
std::vector<std::u32string> ExtractEmojis(const std::u32string& text);

// Returns the two emoji when the (trimmed) message consists of exactly two adjacent emoji.
std::optional<std::pair<std::u32string, std::u32string>> ExtractEmojiPair(const std::string& message);

// "😀" -> "1f600", "❤️" -> "2764-fe0f"
std::string ToCodepointString(const std::u32string& emoji);

}
}
