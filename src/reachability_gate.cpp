#include <enclosure-cache/download_policy.hpp>
#include <enclosure-cache/logger.hpp>
#include <enclosure-cache/metrics_collector.hpp>
#include <enclosure-cache/reachability_gate.hpp>
#include <enclosure-cache/repository_error.hpp>

namespace EnclosureCache
{

ReachabilityGate::ReachabilityGate(ReachabilityProbeFactory &factory) : factory(factory)
{
}

ReachabilityGate::~ReachabilityGate()
{
    release();
}

ReachabilityStatus ReachabilityGate::probe(const std::string &host)
{
    std::unique_ptr<ReachabilityProbe> next = factory.makeProbe(host);
    if (!next)
    {
        Logger::warn(LogCategory::REACHABILITY, "could not create probe for host '{}'", host);
        return ReachabilityStatus::UNKNOWN;
    }

    const ReachabilityStatus status = next->currentStatus();
    Logger::debug(LogCategory::REACHABILITY, "{} is {}", host, DownloadPolicy::reachabilityToString(status));

    if (status == ReachabilityStatus::REACHABLE)
    {
        // Already there, nothing to wait for
        release();
        return status;
    }

    // The new probe is current before it is activated, so a change it
    // reports from inside activate() is not taken for a stale one
    uint64_t generation;
    std::unique_ptr<ReachabilityProbe> previous;
    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        generation = ++next_generation;
        current_generation = generation;
        previous = std::move(current_probe);
    }

    if (previous)
    {
        previous->invalidate();
        previous.reset();
    }

    const bool ok = next->activate(status,
    [this, generation](ReachabilityStatus changed)
    {
        onProbeStatus(generation, changed);
    });

    bool superseded;
    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        superseded = current_generation != generation;
        if (!ok && !superseded)
        {
            current_generation = 0;
        }
        else if (ok && !superseded)
        {
            current_probe = std::move(next);
        }
    }

    if (!ok)
    {
        // Never fatal, the host just counts as unknown
        Logger::warn(LogCategory::REACHABILITY, "{}", RepositoryError::probeInstall(host).what());
        next->invalidate();
        return ReachabilityStatus::UNKNOWN;
    }

    if (superseded)
    {
        // Fired, released or replaced while activating
        Logger::debug(LogCategory::REACHABILITY, "probe #{} for '{}' done before it was armed", generation, host);
        next->invalidate();
        return status;
    }

    GlobalMetrics::instance().recordProbeArmed();
    Logger::debug(LogCategory::REACHABILITY, "armed probe #{} for '{}'", generation, host);

    return status;
}

void ReachabilityGate::setReachableHandler(std::function<void()> handler)
{
    std::unique_lock<std::mutex> lock(gate_mutex);
    reachable_handler = std::move(handler);
    handlers_done.wait(lock,
                       [this]
                       {
                           return handlers_running == 0;
                       });
}

void ReachabilityGate::release()
{
    std::unique_ptr<ReachabilityProbe> previous;
    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        previous = std::move(current_probe);
        current_generation = 0;
    }

    if (!previous)
    {
        return;
    }

    Logger::debug(LogCategory::REACHABILITY, "releasing probe");
    previous->invalidate();
}

bool ReachabilityGate::isArmed() const
{
    std::lock_guard<std::mutex> lock(gate_mutex);
    return current_probe != nullptr;
}

void ReachabilityGate::onProbeStatus(uint64_t generation, ReachabilityStatus status)
{
    Logger::debug(LogCategory::REACHABILITY, "probe #{} reported {}", generation,
                  DownloadPolicy::reachabilityToString(status));

    if (status != ReachabilityStatus::REACHABLE)
    {
        return;
    }

    std::unique_ptr<ReachabilityProbe> fired;
    std::function<void()> handler;
    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        if (generation != current_generation)
        {
            Logger::debug(LogCategory::REACHABILITY, "ignoring stale probe #{}", generation);
            return;
        }

        fired = std::move(current_probe);
        current_generation = 0;
        handler = reachable_handler;
        handlers_running++;
    }

    // Not yet stored when reporting from inside activate()
    if (fired)
    {
        fired->invalidate();
        fired.reset();
    }

    if (handler)
    {
        handler();
    }

    std::lock_guard<std::mutex> lock(gate_mutex);
    handlers_running--;
    handlers_done.notify_all();
}

} // namespace EnclosureCache
