#pragma once

#include "media_url.hpp"
#include "repository_error.hpp"
#include <functional>
#include <optional>

namespace EnclosureCache
{

// Supplies the enclosure URLs of everything currently queued for playback
class QueueSource
{
    public:
    virtual ~QueueSource() = default;

    // Calls on_item once per enclosure, in queue order. Enumeration goes on
    // past problems; the returned error is ENUMERATION, or MISSING_ENTRIES
    // when only some entries could not be found.
    virtual std::optional<RepositoryError> enumerate(const std::function<void(const MediaUrl &)> &on_item) = 0;
};

} // namespace EnclosureCache
