#include <catch2/catch_test_macros.hpp>
#include <enclosure-cache/host_reachability_probe.hpp>
#include <atomic>

using namespace EnclosureCache;

TEST_CASE("HostReachabilityProbe classifies hosts", "[reachability][probe]")
{
    SECTION("Unresolvable names are unknown")
    {
        // .invalid never resolves
        REQUIRE(HostReachabilityProbe::check("enclosures.invalid", {}) == ReachabilityStatus::UNKNOWN);
    }

    SECTION("Resolved addresses without a route are unreachable")
    {
        // Link-local without a scope cannot be routed
        REQUIRE(HostReachabilityProbe::check("fe80::1", {}) == ReachabilityStatus::UNREACHABLE);
    }

    SECTION("Loopback is reachable")
    {
        REQUIRE(HostReachabilityProbe::check("127.0.0.1", {}) == ReachabilityStatus::REACHABLE);
    }

    SECTION("Routes through a constrained interface are cellular")
    {
        REQUIRE(HostReachabilityProbe::check("127.0.0.1", { "lo" }) == ReachabilityStatus::CELLULAR);
    }
}

TEST_CASE("HostReachabilityProbeFactory", "[reachability][probe]")
{
    ReachabilityConfig config;
    config.watch_interval_ms = 10;
    HostReachabilityProbeFactory factory(config);

    SECTION("No probe without a host")
    {
        REQUIRE(factory.makeProbe("") == nullptr);
    }

    SECTION("Probes can be activated once and invalidated repeatedly")
    {
        auto probe = factory.makeProbe("enclosures.invalid");
        REQUIRE(probe != nullptr);
        REQUIRE(probe->currentStatus() == ReachabilityStatus::UNKNOWN);

        std::atomic<int> calls{ 0 };
        REQUIRE(probe->activate(ReachabilityStatus::UNKNOWN,
        [&calls](ReachabilityStatus)
        {
            calls++;
        }));
        REQUIRE_FALSE(probe->activate(ReachabilityStatus::UNKNOWN,
        [](ReachabilityStatus)
        {
        }));

        probe->invalidate();
        probe->invalidate();
        probe.reset();

        // Still unresolvable, nothing changed
        REQUIRE(calls == 0);
    }

    SECTION("Invalidated probes cannot be activated")
    {
        auto probe = factory.makeProbe("enclosures.invalid");
        probe->invalidate();
        REQUIRE_FALSE(probe->activate(ReachabilityStatus::UNKNOWN,
        [](ReachabilityStatus)
        {
        }));
    }
}
