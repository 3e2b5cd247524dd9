#pragma once

#include <cstdint>

namespace EnclosureCache
{

enum class ReachabilityStatus : std::uint8_t
{
    UNKNOWN, // Probe could not be built or could not be armed
    UNREACHABLE, // Host cannot be reached right now
    CELLULAR, // Reachable, but only over a constrained (metered) link
    REACHABLE // Reachable over an unconstrained link
};

enum class TransferIntent : std::uint8_t
{
    DOWNLOAD, // Background fetch, nobody is waiting to play
    STREAM_OR_DOWNLOAD // Playback requested, streaming is acceptable
};

enum class DenialReason : std::uint8_t
{
    UNKNOWN_REACHABILITY, // Status unknown, deny conservatively
    ALL_OFF, // Cellular streaming and downloading both disabled
    STREAMING_ONLY_OVER_CELLULAR, // Cellular streaming disabled, downloads allowed
    DOWNLOADING_ONLY_OVER_CELLULAR, // Cellular downloads disabled, streaming allowed
    NETWORK_UNREACHABLE // No network, only cached files can be served
};

} // namespace EnclosureCache
