#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace EnclosureCache
{

/**
 * Small string helpers shared by the URL parser, the config parser and
 * the logger
 */
class StringUtils
{
    public:
    static std::string toLower(std::string_view str);

    /**
     * Strip leading and trailing whitespace
     */
    static std::string trim(std::string_view str);

    /**
     * Split on a single delimiter, keeping empty fields
     */
    static std::vector<std::string> split(std::string_view str, char delimiter);

    static bool startsWith(std::string_view str, std::string_view prefix);

    /**
     * Decode %XX escapes, leaving malformed escapes untouched
     */
    static std::string percentDecode(std::string_view str);

    /**
     * 64-bit FNV-1a digest rendered as 16 lowercase hex digits
     */
    static std::string hashHex(std::string_view str);
};

} // namespace EnclosureCache
