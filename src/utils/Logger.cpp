#include "Logger.hpp"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>

namespace Fanout {

std::mutex Logger::log_mutex;
LogLevel Logger::min_level_ = LogLevel::Info;
bool Logger::console_enabled_ = true;
std::filesystem::path Logger::logs_dir_{};
std::string Logger::current_date_{};

namespace {

const char* LevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "?????";
}

std::ofstream& LogFile() {
    static std::ofstream file;
    return file;
}

std::tm LocalNow() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    return local;
}

}

void Logger::Init(const std::string& base_dir, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::error_code ec;
    logs_dir_ = std::filesystem::path(base_dir) / "logs";
    std::filesystem::create_directories(logs_dir_, ec);
    if (ec) {
        std::cerr << "Logger: cannot create " << logs_dir_.string() << " (" << ec.message()
                  << "), logging to console only" << std::endl;
        logs_dir_.clear();
    }
    min_level_ = min_level;
    // Reopen on the next line, even if the date is unchanged.
    current_date_.clear();
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level_ = level;
}

void Logger::SetConsoleEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(log_mutex);
    console_enabled_ = enabled;
}

LogLevel Logger::FromString(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (unsigned char c : s) t.push_back((c >= 'A' && c <= 'Z') ? char(c + 32) : char(c));
    if (t == "debug") return LogLevel::Debug;
    if (t == "warn" || t == "warning") return LogLevel::Warn;
    if (t == "error" || t == "err") return LogLevel::Error;
    return LogLevel::Info;
}

std::string Logger::FormatLine(const std::tm& local, LogLevel level, const char* component,
                               const std::string& message) {
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    std::string line = stamp;
    line += " ";
    line += LevelTag(level);
    if (component && *component) {
        line += " [";
        line += component;
        line += "]";
    }
    line += " ";
    line += message;
    return line;
}

void Logger::RotateUnlocked(const std::tm& local) {
    char date[16];
    std::strftime(date, sizeof(date), "%Y-%m-%d", &local);
    if (current_date_ == date) return;

    current_date_ = date;
    auto& file = LogFile();
    if (file.is_open()) file.close();
    file.open(logs_dir_ / (current_date_ + ".log"), std::ios::out | std::ios::app);
}

void Logger::WriteUnlocked(const std::tm& local, const std::string& line) {
    // stdout is reserved for CLI output
    if (console_enabled_) {
        std::cerr << line << '\n';
    }
    if (logs_dir_.empty()) return;

    RotateUnlocked(local);
    auto& file = LogFile();
    if (file.is_open()) {
        file << line << std::endl;
    }
}

void Logger::Log(LogLevel level, const std::string& message) {
    Log(level, nullptr, message);
}

void Logger::Log(LogLevel level, const char* component, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_level_) return;
    const std::tm local = LocalNow();
    WriteUnlocked(local, FormatLine(local, level, component, message));
}

}
