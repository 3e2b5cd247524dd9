#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace EnclosureCache
{

const char *const TIME_FORMAT_DEFAULT = "%Y-%m-%d %H:%M:%S";

class TimeUtils
{
   public:
      static std::string formatDuration(std::chrono::system_clock::duration duration);
      static std::string formatTimestamp(std::chrono::system_clock::time_point tp, const char *format = TIME_FORMAT_DEFAULT);
      static std::chrono::system_clock::time_point fromFileTime(std::filesystem::file_time_type file_time);
};

}
