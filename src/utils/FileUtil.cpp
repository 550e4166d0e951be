#include "FileUtil.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <sstream>
#include <thread>

namespace EmojiKitchen {
namespace FileUtil {

namespace {

std::filesystem::path TempPathFor(const std::filesystem::path& target) {
    static std::atomic<unsigned long long> counter{0};
    std::ostringstream name;
    name << target.filename().string()
         << "." << std::hash<std::thread::id>{}(std::this_thread::get_id())
         << "." << std::chrono::steady_clock::now().time_since_epoch().count()
         << "." << counter.fetch_add(1)
         << ".tmp";
    return target.parent_path() / name.str();
}

} // anonymous namespace

bool WriteFileAtomic(const std::filesystem::path& target, const std::string& data, std::string* error) {
    const auto tmp = TempPathFor(target);
    std::error_code ec;
    {
        std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            if (error) *error = "cannot open " + tmp.string();
            return false;
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            std::filesystem::remove(tmp, ec);
            if (error) *error = "short write to " + tmp.string();
            return false;
        }
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        if (error) *error = "rename to " + target.string() + " failed: " + ec.message();
        return false;
    }
    return true;
}

std::optional<std::string> ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return std::nullopt;
    return ss.str();
}

}
}
