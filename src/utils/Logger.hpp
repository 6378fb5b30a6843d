#pragma once
#include <ctime>
#include <filesystem>
#include <mutex>
#include <string>

namespace Fanout {
    enum class LogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    // Process-wide logger. Lines go to stderr and, after Init(), to
    // <base_dir>/logs/YYYY-MM-DD.log, rotated when the local date changes.
    class Logger {
    public:
        static void Init(const std::string& base_dir, LogLevel min_level);
        static void SetMinLevel(LogLevel level);
        static void SetConsoleEnabled(bool enabled);
        static LogLevel FromString(const std::string& s);

        static void Log(LogLevel level, const std::string& message);
        // Prefixes the message with "[component]".
        static void Log(LogLevel level, const char* component, const std::string& message);

    private:
        static std::string FormatLine(const std::tm& local, LogLevel level, const char* component,
                                      const std::string& message);
        static void WriteUnlocked(const std::tm& local, const std::string& line);
        static void RotateUnlocked(const std::tm& local);

        static std::mutex log_mutex;
        static LogLevel min_level_;
        static bool console_enabled_;
        static std::filesystem::path logs_dir_;
        static std::string current_date_;
    };
}
