#include <enclosure-cache/string_utils.hpp>
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace EnclosureCache
{

std::string StringUtils::toLower(std::string_view str)
{
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c)
                   {
                       return static_cast<char>(std::tolower(c));
                   });
    return result;
}

std::string StringUtils::trim(std::string_view str)
{
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos)
    {
        return {};
    }

    size_t end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(start, end - start + 1));
}

std::vector<std::string> StringUtils::split(std::string_view str, char delimiter)
{
    std::vector<std::string> parts;
    size_t start = 0;

    while (true)
    {
        size_t pos = str.find(delimiter, start);
        if (pos == std::string_view::npos)
        {
            parts.emplace_back(str.substr(start));
            break;
        }

        parts.emplace_back(str.substr(start, pos - start));
        start = pos + 1;
    }

    return parts;
}

bool StringUtils::startsWith(std::string_view str, std::string_view prefix)
{
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::string StringUtils::percentDecode(std::string_view str)
{
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i)
    {
        if (str[i] == '%' && i + 2 < str.size() && std::isxdigit(static_cast<unsigned char>(str[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(str[i + 2])))
        {
            result.push_back(static_cast<char>(std::stoi(std::string(str.substr(i + 1, 2)), nullptr, 16)));
            i += 2;
        }
        else
        {
            result.push_back(str[i]);
        }
    }

    return result;
}

std::string StringUtils::hashHex(std::string_view str)
{
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : str)
    {
        hash ^= c;
        hash *= 1099511628211ULL;
    }

    return fmt::format("{:016x}", hash);
}

} // namespace EnclosureCache
