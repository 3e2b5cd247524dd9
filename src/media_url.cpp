#include <enclosure-cache/media_url.hpp>
#include <enclosure-cache/string_utils.hpp>
#include <algorithm>
#include <cctype>

namespace EnclosureCache
{

namespace
{
bool isValidScheme(std::string_view scheme)
{
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front())))
    {
        return false;
    }

    return std::all_of(scheme.begin(), scheme.end(),
                       [](unsigned char c)
                       {
                           return std::isalnum(c) || c == '+' || c == '-' || c == '.';
                       });
}
} // namespace

std::optional<MediaUrl> MediaUrl::parse(std::string_view url)
{
    const std::string trimmed = StringUtils::trim(url);

    size_t scheme_end = trimmed.find("://");
    if (scheme_end == std::string::npos || !isValidScheme(std::string_view(trimmed).substr(0, scheme_end)))
    {
        return std::nullopt;
    }

    MediaUrl result;
    result.url_ = trimmed;
    result.scheme_ = StringUtils::toLower(std::string_view(trimmed).substr(0, scheme_end));

    std::string_view rest = std::string_view(trimmed).substr(scheme_end + 3);
    size_t path_start = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, path_start);
    std::string_view remainder = path_start == std::string_view::npos ? std::string_view{} : rest.substr(path_start);

    // user:password@host:port
    size_t at = authority.rfind('@');
    if (at != std::string_view::npos)
    {
        authority = authority.substr(at + 1);
    }

    if (!authority.empty() && authority.front() == '[')
    {
        size_t close = authority.find(']');
        if (close == std::string_view::npos)
        {
            return std::nullopt;
        }
        result.host_ = std::string(authority.substr(1, close - 1));
    }
    else
    {
        result.host_ = StringUtils::toLower(authority.substr(0, authority.find(':')));
    }

    size_t path_end = remainder.find_first_of("?#");
    result.path_ = std::string(remainder.substr(0, path_end));
    if (result.path_.empty())
    {
        result.path_ = "/";
    }

    // Only file URLs may omit the host
    if (result.host_.empty() && !result.isFileUrl())
    {
        return std::nullopt;
    }

    return result;
}

MediaUrl MediaUrl::fromLocalPath(const std::filesystem::path &path)
{
    const std::string absolute = std::filesystem::absolute(path).lexically_normal().generic_string();

    std::string encoded;
    encoded.reserve(absolute.size());
    for (char c : absolute)
    {
        switch (c)
        {
        case '%':
            encoded += "%25";
            break;
        case ' ':
            encoded += "%20";
            break;
        case '?':
            encoded += "%3F";
            break;
        case '#':
            encoded += "%23";
            break;
        default:
            encoded.push_back(c);
        }
    }

    MediaUrl result;
    result.url_ = "file://" + encoded;
    result.scheme_ = "file";
    result.path_ = encoded;
    return result;
}

std::filesystem::path MediaUrl::localPath() const
{
    if (!isFileUrl())
    {
        return {};
    }

    return std::filesystem::path(StringUtils::percentDecode(path_));
}

std::string MediaUrl::extension() const
{
    size_t slash = path_.rfind('/');
    std::string_view segment = std::string_view(path_).substr(slash == std::string::npos ? 0 : slash + 1);

    size_t dot = segment.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == segment.size())
    {
        return {};
    }

    std::string ext = StringUtils::toLower(segment.substr(dot));
    // Keep cache file names tame
    if (ext.size() > 8 || !std::all_of(ext.begin() + 1, ext.end(),
                                       [](unsigned char c)
                                       {
                                           return std::isalnum(c);
                                       }))
    {
        return {};
    }

    return ext;
}

} // namespace EnclosureCache
