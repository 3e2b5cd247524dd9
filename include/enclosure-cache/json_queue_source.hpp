#pragma once

#include "queue_source.hpp"
#include <filesystem>

namespace EnclosureCache
{

// Reads the playback queue from a JSON document:
// {"episodes": [{"title": "...", "enclosure": "https://..."}, ...]}
class JsonQueueSource : public QueueSource
{
    public:
    explicit JsonQueueSource(std::filesystem::path queue_file) : queue_file(std::move(queue_file))
    {
    }

    std::optional<RepositoryError> enumerate(const std::function<void(const MediaUrl &)> &on_item) override;

    static std::optional<RepositoryError> enumerateString(std::string_view json_content,
                                                          const std::function<void(const MediaUrl &)> &on_item);

    private:
    std::filesystem::path queue_file;
};

} // namespace EnclosureCache
