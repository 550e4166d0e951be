#pragma once
#include <string>
#include <mutex>
#include <ctime>

#include <filesystem>

namespace EmojiKitchen {
    enum class LogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    class Logger {
    public:
        // Logs go to the console and to <base_dir>/logs/YYYY-MM-DD.log.
        // Daily files older than retention_days are removed when a new day starts (0 keeps everything).
        static void Init(const std::string& base_dir, LogLevel min_level, int retention_days = 0);
        static LogLevel FromString(const std::string& s);
        static void Log(LogLevel level, const std::string& message);
    private:
        static std::mutex log_mutex;
        static LogLevel min_level_;
        static int retention_days_;
        static std::filesystem::path logs_dir_;
        static std::string current_date_;
        static void EnsureLogFileUnlocked(const std::tm& now_tm);
        static void OpenLogFileForDate(const std::string& date);
        static void PruneOldLogsUnlocked(const std::tm& now_tm);
    };
}
