#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace EmojiKitchen {
namespace FileUtil {

// Writes data to a temporary file beside target and renames it over target.
// Every call uses its own temporary name, so concurrent writers of one target never share a file.
// Returns false (with *error filled when given) if anything failed; the temporary file is removed.
bool WriteFileAtomic(const std::filesystem::path& target, const std::string& data, std::string* error = nullptr);

// Reads a whole file in binary mode. std::nullopt if it cannot be opened or read.
std::optional<std::string> ReadFile(const std::filesystem::path& path);

}
}
