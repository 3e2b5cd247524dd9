#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace EnclosureCache
{

// Remote locator of an enclosure, or file:// reference to its local copy.
// Identity is the URL string as given.
class MediaUrl
{
    public:
    static std::optional<MediaUrl> parse(std::string_view url);
    static MediaUrl fromLocalPath(const std::filesystem::path &path);

    const std::string &str() const
    {
        return url_;
    }

    const std::string &scheme() const
    {
        return scheme_;
    }

    const std::string &host() const
    {
        return host_;
    }

    const std::string &path() const
    {
        return path_;
    }

    bool isFileUrl() const
    {
        return scheme_ == "file";
    }

    // Decoded filesystem path of a file:// URL, empty for anything else
    std::filesystem::path localPath() const;

    // Extension of the last path segment including the dot, lowercased
    std::string extension() const;

    bool operator==(const MediaUrl &other) const
    {
        return url_ == other.url_;
    }

    bool operator!=(const MediaUrl &other) const
    {
        return !(*this == other);
    }

    private:
    MediaUrl() = default;

    std::string url_;
    std::string scheme_;
    std::string host_;
    std::string path_;
};

} // namespace EnclosureCache

template <>
struct std::hash<EnclosureCache::MediaUrl>
{
    size_t operator()(const EnclosureCache::MediaUrl &url) const noexcept
    {
        return std::hash<std::string>{}(url.str());
    }
};
