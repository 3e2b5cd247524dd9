#include "../include/enclosure-cache/time_utils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace EnclosureCache
{

std::string TimeUtils::formatDuration(std::chrono::system_clock::duration duration)
{
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration).count();

    if (seconds < 0)
        return "in the future";
    else if (seconds < 60)
        return std::to_string(seconds) + " seconds";
    else if (seconds < 3600)
        return std::to_string(seconds / 60) + " minutes";
    else if (seconds < 86400)
        return std::to_string(seconds / 3600) + " hours";
    else
        return std::to_string(seconds / 86400) + " days";
}

std::string TimeUtils::formatTimestamp(std::chrono::system_clock::time_point tp, const char *format)
{
    auto time_t = std::chrono::system_clock::to_time_t(tp);

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

std::chrono::system_clock::time_point TimeUtils::fromFileTime(std::filesystem::file_time_type file_time)
{
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
    std::chrono::file_clock::to_sys(file_time));
}

} // namespace EnclosureCache
