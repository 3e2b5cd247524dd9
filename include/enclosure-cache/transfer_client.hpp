#pragma once

#include "media_url.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>

namespace EnclosureCache
{

// Decides, file by file, whether the transfer engine may delete a cached
// enclosure during removeAll().
class RemovalApprover
{
    public:
    virtual ~RemovalApprover() = default;

    virtual bool approveRemoval(const MediaUrl &url, std::chrono::system_clock::time_point last_modified) = 0;

    // Whether transfers may use cellular links at all
    virtual bool allowsCellularTransport() const = 0;
};

// The transfer engine. Resolves remote URLs to local files, performs and
// persists the actual transfers.
class TransferClient
{
    public:
    virtual ~TransferClient() = default;

    // Non-blocking lookup, never touches the network
    virtual std::optional<MediaUrl> localFile(const MediaUrl &url) = 0;

    // Returns the local file if complete, otherwise starts or continues a
    // transfer and returns url. Throws on failure.
    virtual MediaUrl start(const MediaUrl &url) = 0;

    virtual void cancel(const MediaUrl &url) = 0;

    // Returns the removed local file, if there was one
    virtual std::optional<MediaUrl> removeFile(const MediaUrl &url) = 0;

    // Removes every cached file not in keeping (URL strings), subject to
    // the approver. Throws on failure.
    virtual void removeAll(const std::unordered_set<std::string> &keeping) = 0;

    virtual void setRemovalApprover(RemovalApprover *approver) = 0;

    // The platform signalled pending events for a background transfer
    // session; done is called once they have been handled.
    virtual void handleBackgroundEvents(const std::string &identifier, std::function<void()> done) = 0;
};

} // namespace EnclosureCache
