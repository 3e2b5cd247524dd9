#include <enclosure-cache/json_queue_source.hpp>
#include <enclosure-cache/logger.hpp>
#include <fstream>
#include <nlohmann/json.hpp>

namespace EnclosureCache
{

std::optional<RepositoryError> JsonQueueSource::enumerate(const std::function<void(const MediaUrl &)> &on_item)
{
    std::ifstream file(queue_file, std::ios::in);
    if (!file.is_open())
    {
        return RepositoryError::enumeration(fmt::format("cannot open queue file {}", queue_file.string()));
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return enumerateString(content, on_item);
}

std::optional<RepositoryError> JsonQueueSource::enumerateString(std::string_view json_content,
                                                                const std::function<void(const MediaUrl &)> &on_item)
{
    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(json_content);
    }
    catch (const nlohmann::json::exception &e)
    {
        return RepositoryError::enumeration(fmt::format("malformed queue: {}", e.what()));
    }

    if (!j.is_object() || !j.contains("episodes") || !j["episodes"].is_array())
    {
        return RepositoryError::enumeration("queue has no episodes array");
    }

    size_t missing = 0;
    size_t index = 0;

    for (const auto &episode : j["episodes"])
    {
        index++;

        if (!episode.is_object())
        {
            missing++;
            continue;
        }

        const std::string title = episode.contains("title") && episode["title"].is_string()
                                  ? episode["title"].get<std::string>()
                                  : std::string("untitled");

        if (!episode.contains("enclosure") || episode["enclosure"].is_null())
        {
            Logger::debug(LogCategory::QUEUE, "episode {} '{}' has no enclosure", index, title);
            continue;
        }

        const auto &enclosure = episode["enclosure"];
        std::optional<MediaUrl> url = enclosure.is_string() ? MediaUrl::parse(enclosure.get<std::string>()) : std::nullopt;
        if (!url)
        {
            Logger::warn(LogCategory::QUEUE, "episode {} '{}' has an invalid enclosure", index, title);
            missing++;
            continue;
        }

        on_item(*url);
    }

    if (missing > 0)
    {
        return RepositoryError::missingEntries(fmt::format("{} of {} queued entries could not be read", missing, index));
    }

    return std::nullopt;
}

} // namespace EnclosureCache
