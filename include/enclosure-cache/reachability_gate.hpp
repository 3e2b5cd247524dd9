#pragma once

#include "reachability_probe.hpp"
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace EnclosureCache
{

/**
 * Owns at most one live reachability probe.
 *
 * probe() answers how a host is reachable right now. Unless the answer
 * is REACHABLE, the probe is kept and armed; once it reports REACHABLE
 * the reachable handler runs and the probe is dropped. Replacing or
 * releasing a probe always invalidates it first, and callbacks from a
 * probe that is no longer held are discarded.
 *
 * release() must be called before the process is suspended, so a
 * deferred callback cannot fire long after the condition that armed it.
 */
class ReachabilityGate
{
    public:
    explicit ReachabilityGate(ReachabilityProbeFactory &factory);
    ~ReachabilityGate();

    ReachabilityGate(const ReachabilityGate &) = delete;
    ReachabilityGate &operator=(const ReachabilityGate &) = delete;

    ReachabilityStatus probe(const std::string &host);

    // Waits for a handler that is currently running to return
    void setReachableHandler(std::function<void()> handler);

    void release();

    bool isArmed() const;

    private:
    void onProbeStatus(uint64_t generation, ReachabilityStatus status);

    ReachabilityProbeFactory &factory;

    mutable std::mutex gate_mutex{};
    std::unique_ptr<ReachabilityProbe> current_probe{};
    uint64_t current_generation = 0; // 0 while nothing is armed
    uint64_t next_generation = 0;
    std::function<void()> reachable_handler{};
    size_t handlers_running = 0;
    std::condition_variable handlers_done{};
};

} // namespace EnclosureCache
