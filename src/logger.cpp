#include "../include/enclosure-cache/logger.hpp"
#include "../include/enclosure-cache/string_utils.hpp"
#include <chrono>
#include <fmt/chrono.h>
#include <iostream>

namespace EnclosureCache
{

namespace
{
struct CategoryName
{
    const char *name;
    LogCategory category;
};

constexpr CategoryName category_names[] = {
    { "general", LogCategory::GENERAL },   { "reachability", LogCategory::REACHABILITY },
    { "policy", LogCategory::POLICY },     { "transfer", LogCategory::TRANSFER },
    { "queue", LogCategory::QUEUE },       { "removal", LogCategory::REMOVAL },
    { "config", LogCategory::CONFIG },     { "metrics", LogCategory::METRICS },
    { "worker", LogCategory::WORKER },
};
} // namespace

void Logger::initialize(LogLevel level, LogOutput output)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);

    instance.current_level = level;
    instance.output_type = output;
    instance.initialized = true;

    if (output == LogOutput::FILE || output == LogOutput::BOTH)
    {
        if (instance.log_filename.empty())
        {
            instance.log_filename = "enclosure-cache.log";
        }

        instance.log_file = std::make_unique<std::ofstream>(instance.log_filename, std::ios::app);

        if (!instance.log_file->is_open())
        {
            instance.output_type = LogOutput::CONSOLE;
            std::cerr << "[Logger] Warning: Could not open log file '" << instance.log_filename
                      << "', falling back to console output\n";
        }
    }
}

void Logger::setLevel(LogLevel level)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);
    instance.current_level = level;
}

void Logger::setOutput(LogOutput output)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);
    instance.output_type = output;
}

void Logger::setLogFile(const std::string &filename)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);

    instance.log_filename = filename;

    // Reopen if we are already writing to a file
    if ((instance.output_type == LogOutput::FILE || instance.output_type == LogOutput::BOTH) && instance.initialized)
    {
        instance.log_file = std::make_unique<std::ofstream>(filename, std::ios::app);

        if (!instance.log_file->is_open())
        {
            std::cerr << "[Logger] Warning: Could not open log file '" << filename << "'\n";
        }
    }
}

void Logger::setCategories(LogCategory categories)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);
    instance.enabled_categories = categories;
}

void Logger::setCategoriesFromString(const std::string &categories_str)
{
    if (StringUtils::toLower(StringUtils::trim(categories_str)) == "all")
    {
        setCategories(LogCategory::ALL);
        return;
    }

    uint32_t mask = 0;
    for (const auto &token : StringUtils::split(categories_str, ','))
    {
        const std::string name = StringUtils::toLower(StringUtils::trim(token));
        bool known = false;

        for (const auto &entry : category_names)
        {
            if (name == entry.name)
            {
                mask |= static_cast<uint32_t>(entry.category);
                known = true;
                break;
            }
        }

        if (!known && !name.empty())
        {
            warn_fallback("Unknown log category '{}' ignored", name);
        }
    }

    setCategories(static_cast<LogCategory>(mask));
}

void Logger::shutdown()
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);

    if (instance.log_file && instance.log_file->is_open())
    {
        instance.log_file->close();
    }
    instance.log_file.reset();
    instance.initialized = false;
}

bool Logger::isEnabled(LogLevel level)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);
    return instance.initialized && instance.output_type != LogOutput::DISABLED && level != LogLevel::OFF &&
           level >= instance.current_level;
}

bool Logger::isEnabled(LogCategory category)
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.log_mutex);
    return (static_cast<uint32_t>(instance.enabled_categories) & static_cast<uint32_t>(category)) != 0;
}

std::string Logger::levelToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::TRACE:
        return "TRACE";
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO ";
    case LogLevel::WARN:
        return "WARN ";
    case LogLevel::ERR:
        return "ERROR";
    case LogLevel::FATAL:
        return "FATAL";
    case LogLevel::OFF:
        return "OFF  ";
    default:
        return "UNKN ";
    }
}

std::string Logger::categoryToString(LogCategory category)
{
    switch (category)
    {
    case LogCategory::GENERAL:
        return "GEN";
    case LogCategory::REACHABILITY:
        return "NET";
    case LogCategory::POLICY:
        return "POL";
    case LogCategory::TRANSFER:
        return "XFR";
    case LogCategory::QUEUE:
        return "QUE";
    case LogCategory::REMOVAL:
        return "RMV";
    case LogCategory::CONFIG:
        return "CFG";
    case LogCategory::METRICS:
        return "MET";
    case LogCategory::WORKER:
        return "WRK";
    default:
        return "UNK";
    }
}

LogLevel Logger::parseLevel(const std::string &level_str)
{
    const std::string lower_level = StringUtils::toLower(level_str);

    if (lower_level == "trace")
        return LogLevel::TRACE;
    if (lower_level == "debug")
        return LogLevel::DEBUG;
    if (lower_level == "info")
        return LogLevel::INFO;
    if (lower_level == "warn")
        return LogLevel::WARN;
    if (lower_level == "error")
        return LogLevel::ERR;
    if (lower_level == "fatal")
        return LogLevel::FATAL;
    if (lower_level == "off")
        return LogLevel::OFF;

    warn_fallback("Unknown log level '{}', using INFO", level_str);
    return LogLevel::INFO;
}

LogOutput Logger::parseOutput(const std::string &output_str)
{
    const std::string lower_output = StringUtils::toLower(output_str);

    if (lower_output == "console")
        return LogOutput::CONSOLE;
    if (lower_output == "file")
        return LogOutput::FILE;
    if (lower_output == "both")
        return LogOutput::BOTH;
    if (lower_output == "disabled")
        return LogOutput::DISABLED;

    warn_fallback("Unknown log output '{}', using CONSOLE", output_str);
    return LogOutput::CONSOLE;
}

std::string Logger::getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d}", local_tm, ms.count());
}

Logger &Logger::getInstance()
{
    static Logger instance;
    return instance;
}

void Logger::writeLog(LogLevel level, LogCategory category, const std::string &message)
{
    const std::string line = fmt::format("[{}] [{}] [{}] {}\n", getCurrentTimestamp(), levelToString(level),
                                         categoryToString(category), message);

    std::lock_guard<std::mutex> lock(log_mutex);

    switch (output_type)
    {
    case LogOutput::CONSOLE:
        writeToConsole(line, level);
        break;
    case LogOutput::FILE:
        writeToFile(line);
        break;
    case LogOutput::BOTH:
        writeToConsole(line, level);
        writeToFile(line);
        break;
    case LogOutput::DISABLED:
        break;
    }
}

void Logger::writeToConsole(const std::string &line, LogLevel level)
{
    // Warnings and worse go to stderr
    std::ostream &output = (level >= LogLevel::WARN) ? std::cerr : std::cout;
    output << line;
}

void Logger::writeToFile(const std::string &line)
{
    if (!log_file || !log_file->is_open())
    {
        return;
    }

    *log_file << line;
    log_file->flush();
}

void Logger::warn_fallback(const std::string &message)
{
    std::cerr << fmt::format("[FALLBACK WARN] {}\n", message);
}

} // namespace EnclosureCache
