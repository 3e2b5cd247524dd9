#include "test_fakes.hpp"
#include <catch2/catch_test_macros.hpp>
#include <enclosure-cache/reachability_gate.hpp>

using namespace EnclosureCache;
using namespace EnclosureCache::Testing;

TEST_CASE("ReachabilityGate reports the probe's status", "[reachability]")
{
    FakeProbeFactory factory;
    ReachabilityGate gate(factory);

    SECTION("Reachable hosts need no watching")
    {
        factory.status = ReachabilityStatus::REACHABLE;
        REQUIRE(gate.probe("example.com") == ReachabilityStatus::REACHABLE);
        REQUIRE_FALSE(gate.isArmed());
        REQUIRE(factory.probes.at(0)->activations == 0);
    }

    SECTION("Other answers arm a probe")
    {
        factory.status = ReachabilityStatus::CELLULAR;
        REQUIRE(gate.probe("example.com") == ReachabilityStatus::CELLULAR);
        REQUIRE(gate.isArmed());
        REQUIRE(factory.probes.at(0)->activations == 1);
        REQUIRE(factory.probes.at(0)->host == "example.com");
        REQUIRE(factory.probes.at(0)->activated_with == ReachabilityStatus::CELLULAR);
    }

    SECTION("No probe for an empty host")
    {
        REQUIRE(gate.probe("") == ReachabilityStatus::UNKNOWN);
        REQUIRE_FALSE(gate.isArmed());
    }

    SECTION("Failed activation leaves nothing armed")
    {
        factory.status = ReachabilityStatus::UNREACHABLE;
        factory.fail_activation = true;
        REQUIRE(gate.probe("example.com") == ReachabilityStatus::UNKNOWN);
        REQUIRE_FALSE(gate.isArmed());
        REQUIRE(factory.probes.at(0)->destroyed);
    }
}

TEST_CASE("ReachabilityGate holds at most one probe", "[reachability]")
{
    FakeProbeFactory factory;
    factory.status = ReachabilityStatus::UNREACHABLE;
    ReachabilityGate gate(factory);

    gate.probe("one.example.com");
    gate.probe("two.example.com");

    REQUIRE(factory.probes.size() == 2);
    REQUIRE(factory.probes[0]->invalidations == 1);
    REQUIRE(factory.probes[0]->destroyed);
    REQUIRE_FALSE(factory.probes[1]->destroyed);
    REQUIRE(gate.isArmed());
}

TEST_CASE("ReachabilityGate fires once when the network comes back", "[reachability]")
{
    FakeProbeFactory factory;
    factory.status = ReachabilityStatus::UNREACHABLE;
    ReachabilityGate gate(factory);

    int fired = 0;
    gate.setReachableHandler(
    [&fired]
    {
        fired++;
    });

    gate.probe("example.com");
    auto control = factory.probes.at(0);

    SECTION("Changes other than reachable are ignored")
    {
        control->fire(ReachabilityStatus::CELLULAR);
        REQUIRE(fired == 0);
        REQUIRE(gate.isArmed());
    }

    SECTION("Reachable releases the probe and notifies")
    {
        control->fire(ReachabilityStatus::REACHABLE);
        REQUIRE(fired == 1);
        REQUIRE_FALSE(gate.isArmed());
        REQUIRE(control->destroyed);

        control->fire(ReachabilityStatus::REACHABLE);
        REQUIRE(fired == 1);
    }

    SECTION("A replaced probe no longer triggers the handler")
    {
        ReachabilityCallback stale = control->callback;
        gate.probe("example.com");

        stale(ReachabilityStatus::REACHABLE);
        REQUIRE(fired == 0);
        REQUIRE(gate.isArmed());

        factory.probes.at(1)->fire(ReachabilityStatus::REACHABLE);
        REQUIRE(fired == 1);
    }
}

TEST_CASE("ReachabilityGate keeps changes reported during activation", "[reachability]")
{
    FakeProbeFactory factory;
    factory.status = ReachabilityStatus::UNREACHABLE;
    ReachabilityGate gate(factory);

    int fired = 0;
    gate.setReachableHandler(
    [&fired]
    {
        fired++;
    });

    SECTION("Reachable before activate() returns fires the handler")
    {
        factory.report_on_activate = ReachabilityStatus::REACHABLE;

        REQUIRE(gate.probe("example.com") == ReachabilityStatus::UNREACHABLE);
        REQUIRE(fired == 1);
        REQUIRE_FALSE(gate.isArmed());

        auto control = factory.probes.at(0);
        REQUIRE(control->destroyed);
        REQUIRE(control->invalidations >= 1);

        control->fire(ReachabilityStatus::REACHABLE);
        REQUIRE(fired == 1);
    }

    SECTION("Other early changes leave the probe armed")
    {
        factory.report_on_activate = ReachabilityStatus::CELLULAR;

        gate.probe("example.com");
        REQUIRE(fired == 0);
        REQUIRE(gate.isArmed());

        factory.probes.at(0)->fire(ReachabilityStatus::REACHABLE);
        REQUIRE(fired == 1);
        REQUIRE_FALSE(gate.isArmed());
    }
}

TEST_CASE("ReachabilityGate release is idempotent", "[reachability]")
{
    FakeProbeFactory factory;
    factory.status = ReachabilityStatus::CELLULAR;
    ReachabilityGate gate(factory);

    gate.probe("example.com");
    auto control = factory.probes.at(0);

    gate.release();
    gate.release();

    REQUIRE(control->invalidations == 1);
    REQUIRE(control->destroyed);
    REQUIRE_FALSE(gate.isArmed());

    // Fresh gate with nothing ever armed
    ReachabilityGate idle(factory);
    idle.release();
    idle.release();
    REQUIRE_FALSE(idle.isArmed());
}
