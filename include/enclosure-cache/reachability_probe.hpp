#pragma once

#include "../types/reachability_status.hpp"
#include <functional>
#include <memory>
#include <string>

namespace EnclosureCache
{

using ReachabilityCallback = std::function<void(ReachabilityStatus)>;

// One reachability probe for one host
class ReachabilityProbe
{
    public:
    virtual ~ReachabilityProbe() = default;

    // Synchronous check, may block briefly on name resolution
    virtual ReachabilityStatus currentStatus() = 0;

    // Installs a listener reporting every status differing from initial,
    // the status the caller last observed. The listener may run before
    // activate() returns. Returns false if it could not be installed.
    virtual bool activate(ReachabilityStatus initial, ReachabilityCallback callback) = 0;

    // Uninstalls the listener. Idempotent, and safe to call from inside
    // the callback.
    virtual void invalidate() = 0;
};

class ReachabilityProbeFactory
{
    public:
    virtual ~ReachabilityProbeFactory() = default;

    // Returns nullptr if no probe can be built for host
    virtual std::unique_ptr<ReachabilityProbe> makeProbe(const std::string &host) = 0;
};

} // namespace EnclosureCache
