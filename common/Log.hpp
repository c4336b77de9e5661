#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace net_scan::common
{
    enum class LogLevel
    {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
    };

    const char *ToString(LogLevel level);

    bool ParseLogLevel(std::string_view raw, LogLevel &level, std::string &error);

    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel();

    bool ShouldLog(LogLevel level);

    // Writes "[Tag] message" to stderr when level passes the global threshold.
    void Write(LogLevel level, std::string_view tag, std::string_view message);

    // Stream-style builder, flushed on destruction:
    //   Log(LogLevel::Warn, "Arp") << "table read failed: " << err;
    class Log
    {
    public:
        Log(LogLevel level, std::string_view tag) : m_level(level), m_tag(tag), m_enabled(ShouldLog(level)) {}
        ~Log()
        {
            if (m_enabled)
                Write(m_level, m_tag, m_stream.str());
        }

        Log(const Log &) = delete;
        Log &operator=(const Log &) = delete;

        template <typename T>
        Log &operator<<(const T &value)
        {
            if (m_enabled)
                m_stream << value;
            return *this;
        }

    private:
        LogLevel m_level;
        std::string m_tag;
        bool m_enabled;
        std::ostringstream m_stream;
    };
}
