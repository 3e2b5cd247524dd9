#pragma once

#include "../types/config.hpp"
#include <optional>
#include <string_view>

namespace EnclosureCache
{

class ConfigParser
{
    public:
    static std::optional<Config> parseJsonFile(std::string_view file_path);
    static std::optional<Config> parseJsonString(std::string_view json_content);
};

} // namespace EnclosureCache
