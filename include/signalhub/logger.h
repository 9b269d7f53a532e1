#pragma once

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <chrono>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace signalhub
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

inline std::optional<LogLevel> parse_log_level(std::string_view name)
{
    if (name == "debug")
        return LogLevel::Debug;
    if (name == "info")
        return LogLevel::Info;
    if (name == "warning" || name == "warn")
        return LogLevel::Warning;
    if (name == "error")
        return LogLevel::Error;
    return std::nullopt;
}

class Logger
{
  public:
    static Logger& instance()
    {
        static Logger inst;
        return inst;
    }

    void set_level(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    bool enabled(LogLevel level) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= level_;
    }

    void log(LogLevel level, const std::string& message)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_)
            return;

        std::string_view prefix;
        switch (level)
        {
            case LogLevel::Debug:
                prefix = "[DEBUG] ";
                break;
            case LogLevel::Info:
                prefix = "[INFO] ";
                break;
            case LogLevel::Warning:
                prefix = "[WARN] ";
                break;
            case LogLevel::Error:
                prefix = "[ERROR] ";
                break;
        }

        auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
        auto* stream = level >= LogLevel::Warning ? stderr : stdout;
        fmt::print(stream, "{:%Y-%m-%d %H:%M:%S} {}{}\n", now, prefix, message);
        std::fflush(stream);
    }

    template<typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args)
    {
        if (!enabled(level))
            return;
        log(level, fmt::format(format, std::forward<Args>(args)...));
    }

  private:
    Logger() = default;
    mutable std::mutex mutex_;
    LogLevel level_{LogLevel::Info};
};

template<typename... Args>
inline void log_debug(fmt::format_string<Args...> format, Args&&... args)
{
    Logger::instance().log(LogLevel::Debug, format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_info(fmt::format_string<Args...> format, Args&&... args)
{
    Logger::instance().log(LogLevel::Info, format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warning(fmt::format_string<Args...> format, Args&&... args)
{
    Logger::instance().log(LogLevel::Warning, format, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(fmt::format_string<Args...> format, Args&&... args)
{
    Logger::instance().log(LogLevel::Error, format, std::forward<Args>(args)...);
}

}  // namespace signalhub
