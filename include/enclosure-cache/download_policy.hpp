#pragma once

#include "../types/reachability_status.hpp"
#include "../types/user_data_policy.hpp"
#include <optional>
#include <string>

namespace EnclosureCache
{

struct PolicyDecision
{
    bool allowed = false;
    std::optional<DenialReason> reason; // Set whenever allowed is false

    static PolicyDecision allow()
    {
        return { true, std::nullopt };
    }

    static PolicyDecision deny(DenialReason why)
    {
        return { false, why };
    }

    bool operator==(const PolicyDecision &) const = default;
};

/**
 * Streaming versus downloading tradeoffs, in one table.
 *
 * UNKNOWN                      -> deny UNKNOWN_REACHABILITY
 * REACHABLE                    -> allow
 * CELLULAR, stream + download  -> allow
 * CELLULAR, stream only        -> allow STREAM_OR_DOWNLOAD, deny DOWNLOADING_ONLY_OVER_CELLULAR
 * CELLULAR, download only      -> allow DOWNLOAD, deny STREAMING_ONLY_OVER_CELLULAR
 * CELLULAR, neither            -> deny ALL_OFF
 * UNREACHABLE                  -> deny NETWORK_UNREACHABLE (cache hits are served before asking)
 *
 * Changes to what the user settings mean go here, not into callers.
 */
class DownloadPolicy
{
    public:
    static PolicyDecision decide(TransferIntent intent, ReachabilityStatus status, const UserDataPolicy &settings);

    static std::string denialReasonToString(DenialReason reason);
    static std::string reachabilityToString(ReachabilityStatus status);
    static std::string intentToString(TransferIntent intent);
};

} // namespace EnclosureCache
