#include "Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace net_scan::common
{
    namespace
    {
        std::atomic<int> g_threshold{static_cast<int>(LogLevel::Info)};
        std::mutex g_writeMutex;
    }

    const char *ToString(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        }
        return "INFO";
    }

    bool ParseLogLevel(std::string_view raw, LogLevel &level, std::string &error)
    {
        error.clear();
        if (raw.empty())
        {
            error = "missing value for --log-level (expected debug|info|warn|error)";
            return false;
        }

        std::string normalized(raw);
        std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (normalized == "debug")
            level = LogLevel::Debug;
        else if (normalized == "info")
            level = LogLevel::Info;
        else if (normalized == "warn" || normalized == "warning")
            level = LogLevel::Warn;
        else if (normalized == "error")
            level = LogLevel::Error;
        else
        {
            error = "invalid --log-level '" + std::string(raw) + "' (expected debug|info|warn|error)";
            return false;
        }
        return true;
    }

    void SetLogLevel(LogLevel level)
    {
        g_threshold = static_cast<int>(level);
    }

    LogLevel GetLogLevel()
    {
        return static_cast<LogLevel>(g_threshold.load());
    }

    bool ShouldLog(LogLevel level)
    {
        return static_cast<int>(level) >= g_threshold.load();
    }

    void Write(LogLevel level, std::string_view tag, std::string_view message)
    {
        if (!ShouldLog(level))
            return;

        const auto now = std::chrono::system_clock::now();
        const std::time_t t = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::lock_guard<std::mutex> lock(g_writeMutex);
        std::cerr << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms
                  << std::setfill(' ') << ' ' << ToString(level) << " [" << tag << "] " << message << '\n';
    }
}
