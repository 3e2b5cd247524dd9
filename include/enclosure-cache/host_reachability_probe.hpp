#pragma once

#include "../types/config.hpp"
#include "reachability_probe.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace EnclosureCache
{

/**
 * Probes one host through the system resolver and routing table.
 *
 * A host that does not resolve is UNKNOWN; one that resolves but has no
 * route is UNREACHABLE. If the local interface the route leaves through
 * matches one of the constrained prefixes the host is CELLULAR, otherwise
 * REACHABLE.
 *
 * activate() starts a watch thread polling at a fixed interval and
 * reporting every change from the status the caller last saw. The thread only holds shared state, so the
 * probe may be invalidated and destroyed from inside its own callback.
 */
class HostReachabilityProbe : public ReachabilityProbe
{
    public:
    HostReachabilityProbe(std::string host, const ReachabilityConfig &config);
    ~HostReachabilityProbe() override;

    HostReachabilityProbe(const HostReachabilityProbe &) = delete;
    HostReachabilityProbe &operator=(const HostReachabilityProbe &) = delete;

    ReachabilityStatus currentStatus() override;
    bool activate(ReachabilityStatus initial, ReachabilityCallback callback) override;
    void invalidate() override;

    static ReachabilityStatus check(const std::string &host, const std::vector<std::string> &constrained_prefixes);

    private:
    struct WatchState
    {
        std::string host;
        std::vector<std::string> constrained_prefixes;
        std::chrono::milliseconds interval;

        std::mutex mutex{};
        std::condition_variable wakeup{};
        bool stopped = false;
        ReachabilityCallback callback{};
    };

    static void watch(std::shared_ptr<WatchState> state, ReachabilityStatus last);

    std::shared_ptr<WatchState> state;
    std::thread watch_thread{};
};

class HostReachabilityProbeFactory : public ReachabilityProbeFactory
{
    public:
    explicit HostReachabilityProbeFactory(const ReachabilityConfig &config) : config(config)
    {
    }

    std::unique_ptr<ReachabilityProbe> makeProbe(const std::string &host) override;

    private:
    ReachabilityConfig config;
};

} // namespace EnclosureCache
