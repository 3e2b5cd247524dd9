#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace EnclosureCache
{

enum class LogLevel : std::uint8_t
{
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,
    FATAL = 5,
    OFF = 6
};

enum class LogOutput : std::uint8_t
{
    CONSOLE = 0,
    FILE = 1,
    BOTH = 2,
    DISABLED = 3
};

enum class LogCategory : std::uint32_t
{
    GENERAL = 1 << 0,      // 0x001 - Startup, shutdown, driver
    REACHABILITY = 1 << 1, // 0x002 - Probes and reachability callbacks
    POLICY = 1 << 2,       // 0x004 - Download policy decisions
    TRANSFER = 1 << 3,     // 0x008 - Transfer client calls
    QUEUE = 1 << 4,        // 0x010 - Queue enumeration and preloading
    REMOVAL = 1 << 5,      // 0x020 - Stale file removal
    CONFIG = 1 << 6,       // 0x040 - Configuration
    METRICS = 1 << 7,      // 0x080 - Metrics exposition
    WORKER = 1 << 8,       // 0x100 - Worker pool
    ALL = 0xFFFFFFFF
};

class Logger
{
    public:
    static void initialize(LogLevel level = LogLevel::INFO, LogOutput output = LogOutput::CONSOLE);
    static void setLevel(LogLevel level);
    static void setOutput(LogOutput output);
    static void setLogFile(const std::string &filename);
    static void setCategories(LogCategory categories);
    static void setCategoriesFromString(const std::string &categories_str);
    static void shutdown();

    // Usable before initialize(), always goes to stderr
    static void warn_fallback(const std::string &message);

    template <typename... Args>
    static void warn_fallback(const std::string &format, Args &&...args);

    template <typename... Args>
    static void trace(LogCategory category, const std::string &format, Args &&...args);

    template <typename... Args>
    static void debug(LogCategory category, const std::string &format, Args &&...args);

    template <typename... Args>
    static void info(LogCategory category, const std::string &format, Args &&...args);

    template <typename... Args>
    static void warn(LogCategory category, const std::string &format, Args &&...args);

    template <typename... Args>
    static void error(LogCategory category, const std::string &format, Args &&...args);

    template <typename... Args>
    static void fatal(LogCategory category, const std::string &format, Args &&...args);

    template <typename... Args>
    static void info(const std::string &format, Args &&...args);

    template <typename... Args>
    static void warn(const std::string &format, Args &&...args);

    template <typename... Args>
    static void error(const std::string &format, Args &&...args);

    static bool isEnabled(LogLevel level);
    static bool isEnabled(LogCategory category);
    static std::string levelToString(LogLevel level);
    static std::string categoryToString(LogCategory category);
    static std::string getCurrentTimestamp();

    static LogLevel parseLevel(const std::string &level_str);
    static LogOutput parseOutput(const std::string &output_str);

    private:
    Logger() = default;
    ~Logger() = default;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    static Logger &getInstance();
    void writeLog(LogLevel level, LogCategory category, const std::string &message);
    void writeToConsole(const std::string &line, LogLevel level);
    void writeToFile(const std::string &line);

    template <typename... Args>
    static void log(LogLevel level, LogCategory category, const std::string &format, Args &&...args);

    template <typename... Args>
    static std::string formatString(const std::string &format, Args &&...args);

    LogLevel current_level{ LogLevel::INFO };
    LogOutput output_type{ LogOutput::CONSOLE };
    LogCategory enabled_categories{ LogCategory::ALL };
    std::string log_filename;
    std::unique_ptr<std::ofstream> log_file;
    mutable std::mutex log_mutex;
    bool initialized{ false };
};

template <typename... Args>
void Logger::log(LogLevel level, LogCategory category, const std::string &format, Args &&...args)
{
#ifndef NO_LOGGING
    if (isEnabled(level) && isEnabled(category))
    {
        getInstance().writeLog(level, category, formatString(format, std::forward<Args>(args)...));
    }
#endif
}

template <typename... Args>
void Logger::trace(LogCategory category, const std::string &format, Args &&...args)
{
    log(LogLevel::TRACE, category, format, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::debug(LogCategory category, const std::string &format, Args &&...args)
{
    log(LogLevel::DEBUG, category, format, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::info(LogCategory category, const std::string &format, Args &&...args)
{
    log(LogLevel::INFO, category, format, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::warn(LogCategory category, const std::string &format, Args &&...args)
{
    log(LogLevel::WARN, category, format, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::error(LogCategory category, const std::string &format, Args &&...args)
{
    log(LogLevel::ERR, category, format, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::fatal(LogCategory category, const std::string &format, Args &&...args)
{
    log(LogLevel::FATAL, category, format, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::info(const std::string &format, Args &&...args)
{
    log(LogLevel::INFO, LogCategory::GENERAL, format, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::warn(const std::string &format, Args &&...args)
{
    log(LogLevel::WARN, LogCategory::GENERAL, format, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::error(const std::string &format, Args &&...args)
{
    log(LogLevel::ERR, LogCategory::GENERAL, format, std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::warn_fallback(const std::string &format, Args &&...args)
{
    warn_fallback(formatString(format, std::forward<Args>(args)...));
}

template <typename... Args>
std::string Logger::formatString(const std::string &format, Args &&...args)
{
    if constexpr (sizeof...(args) == 0)
    {
        return format;
    }
    else
    {
        return fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
    }
}

// Usage:
// EnclosureCache::Logger::info(LogCategory::QUEUE, "preloading {} enclosures", count);
// EnclosureCache::Logger::debug(LogCategory::POLICY, "denied: {}", reason);

} // namespace EnclosureCache
