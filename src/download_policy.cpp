#include <enclosure-cache/download_policy.hpp>

namespace EnclosureCache
{

PolicyDecision DownloadPolicy::decide(TransferIntent intent, ReachabilityStatus status, const UserDataPolicy &settings)
{
    switch (status)
    {
    case ReachabilityStatus::UNKNOWN:
        return PolicyDecision::deny(DenialReason::UNKNOWN_REACHABILITY);

    case ReachabilityStatus::REACHABLE:
        return PolicyDecision::allow();

    case ReachabilityStatus::CELLULAR:
        if (settings.allow_cellular_streaming && settings.allow_cellular_downloads)
        {
            return PolicyDecision::allow();
        }
        if (settings.allow_cellular_streaming)
        {
            return intent == TransferIntent::STREAM_OR_DOWNLOAD
                   ? PolicyDecision::allow()
                   : PolicyDecision::deny(DenialReason::DOWNLOADING_ONLY_OVER_CELLULAR);
        }
        if (settings.allow_cellular_downloads)
        {
            return intent == TransferIntent::DOWNLOAD ? PolicyDecision::allow()
                                                      : PolicyDecision::deny(DenialReason::STREAMING_ONLY_OVER_CELLULAR);
        }
        return PolicyDecision::deny(DenialReason::ALL_OFF);

    case ReachabilityStatus::UNREACHABLE:
        return PolicyDecision::deny(DenialReason::NETWORK_UNREACHABLE);
    }

    return PolicyDecision::deny(DenialReason::UNKNOWN_REACHABILITY);
}

std::string DownloadPolicy::denialReasonToString(DenialReason reason)
{
    switch (reason)
    {
    case DenialReason::UNKNOWN_REACHABILITY:
        return "unknown_reachability";
    case DenialReason::ALL_OFF:
        return "all_off";
    case DenialReason::STREAMING_ONLY_OVER_CELLULAR:
        return "streaming_only_over_cellular";
    case DenialReason::DOWNLOADING_ONLY_OVER_CELLULAR:
        return "downloading_only_over_cellular";
    case DenialReason::NETWORK_UNREACHABLE:
        return "network_unreachable";
    default:
        return "unknown";
    }
}

std::string DownloadPolicy::reachabilityToString(ReachabilityStatus status)
{
    switch (status)
    {
    case ReachabilityStatus::UNKNOWN:
        return "unknown";
    case ReachabilityStatus::UNREACHABLE:
        return "unreachable";
    case ReachabilityStatus::CELLULAR:
        return "cellular";
    case ReachabilityStatus::REACHABLE:
        return "reachable";
    default:
        return "invalid";
    }
}

std::string DownloadPolicy::intentToString(TransferIntent intent)
{
    return intent == TransferIntent::DOWNLOAD ? "download" : "stream_or_download";
}

} // namespace EnclosureCache
