
#include "Logger.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <fstream>
#include <vector>

namespace EmojiKitchen {

std::mutex Logger::log_mutex;
LogLevel Logger::min_level_ = LogLevel::Debug;
int Logger::retention_days_ = 0;
std::filesystem::path Logger::logs_dir_{};
std::string Logger::current_date_{};

static inline std::string TwoDigits(int v) {
    char buf[3];
    buf[0] = char('0' + (v / 10));
    buf[1] = char('0' + (v % 10));
    buf[2] = '\0';
    return std::string(buf, 2);
}

static inline std::string DateString(const std::tm& t) {
    return std::to_string(1900 + t.tm_year) + "-" + TwoDigits(t.tm_mon + 1) + "-" + TwoDigits(t.tm_mday);
}

void Logger::Init(const std::string& base_dir, LogLevel min_level, int retention_days) {
    std::lock_guard<std::mutex> lock(log_mutex);
    logs_dir_ = std::filesystem::path(base_dir) / "logs";
    std::error_code ec;
    std::filesystem::create_directories(logs_dir_, ec);
    min_level_ = min_level;
    retention_days_ = retention_days;
    current_date_.clear();
}

LogLevel Logger::FromString(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (unsigned char c : s) t.push_back((c >= 'A' && c <= 'Z') ? char(c + 32) : char(c));
    if (t == "debug") return LogLevel::Debug;
    if (t == "info")  return LogLevel::Info;
    if (t == "warn" || t == "warning")  return LogLevel::Warn;
    if (t == "error" || t == "err") return LogLevel::Error;
    return LogLevel::Info;
}

static std::ofstream& GetFileStream() {
    static std::ofstream ofs;
    return ofs;
}

void Logger::OpenLogFileForDate(const std::string& date) {
    auto& ofs = GetFileStream();
    if (ofs.is_open()) ofs.close();
    std::filesystem::path file = logs_dir_ / (date + ".log");
    ofs.open(file, std::ios::out | std::ios::app);
}

void Logger::PruneOldLogsUnlocked(const std::tm& now_tm) {
    if (retention_days_ <= 0) return;

    std::tm cutoff_tm = now_tm;
    cutoff_tm.tm_mday -= retention_days_;
    cutoff_tm.tm_isdst = -1;
    std::time_t cutoff_t = std::mktime(&cutoff_tm);
    std::tm normalized{};
    #ifdef _WIN32
    localtime_s(&normalized, &cutoff_t);
    #else
    localtime_r(&cutoff_t, &normalized);
    #endif
    // File names are YYYY-MM-DD, so lexical order is date order.
    const std::string cutoff = DateString(normalized);

    std::error_code ec;
    std::vector<std::filesystem::path> expired;
    for (std::filesystem::directory_iterator it(logs_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& p = it->path();
        if (p.extension() != ".log") continue;
        const std::string stem = p.stem().string();
        if (stem.size() == 10 && stem < cutoff) expired.push_back(p);
    }
    for (const auto& p : expired) {
        std::filesystem::remove(p, ec);
    }
}

void Logger::EnsureLogFileUnlocked(const std::tm& now_tm) {
    std::string date = DateString(now_tm);
    if (date != current_date_) {
        current_date_ = date;
        OpenLogFileForDate(date);
        PruneOldLogsUnlocked(now_tm);
    }
}

void Logger::Log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_level_) return;
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);

    std::tm buf;
    #ifdef _WIN32
    localtime_s(&buf, &in_time_t);
    #else
    localtime_r(&in_time_t, &buf);
    #endif

    const char* level_str = "";
    switch (level) {
        case LogLevel::Debug: level_str = "Debug"; break;
        case LogLevel::Info:  level_str = "Info";  break;
        case LogLevel::Warn:  level_str = "Warn";  break;
        case LogLevel::Error: level_str = "Error"; break;
    }

    // Console
    std::cout << std::put_time(&buf, "%Y-%m-%d %X") << " [" << level_str << "] " << message << std::endl;

    // File (logs/YYYY-MM-DD.log)
    if (!logs_dir_.empty()) {
        EnsureLogFileUnlocked(buf);
        auto& ofs = GetFileStream();
        if (ofs.is_open()) {
            ofs << std::put_time(&buf, "%Y-%m-%d %X") << " [" << level_str << "] " << message << std::endl;
        }
    }
}

}
