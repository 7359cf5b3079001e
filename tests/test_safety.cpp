#include <catch2/catch.hpp>
#include "Kinematics.hpp"
#include "SafetyChecker.hpp"
#include "SignalController.hpp"

using namespace scramble;

TEST_CASE("SafetyChecker rejects conflicting greens", "[safety]")
{
    SafetyChecker c;
    IntersectionState s;
    s.north_south = LightState::Green;
    s.east_west = LightState::Green; // conflict with north-south
    REQUIRE(c.isSafe(s) == false);

    s.east_west = LightState::Yellow;
    REQUIRE(c.isSafe(s) == false);
}

TEST_CASE("SafetyChecker accepts single axis green", "[safety]")
{
    SafetyChecker c;
    IntersectionState s;
    s.north_south = LightState::Green;
    s.east_west = LightState::Red;
    REQUIRE(c.isSafe(s) == true);
}

TEST_CASE("Walk signal requires every vehicle lamp red", "[safety]")
{
    SafetyChecker c;
    IntersectionState s;
    s.pedestrians = WalkState::Walk;
    REQUIRE(c.isSafe(s) == true);

    s.north_south = LightState::Yellow;
    REQUIRE(c.isSafe(s) == false);

    s.north_south = LightState::Red;
    s.east_west = LightState::Green;
    s.pedestrians = WalkState::Flashing;
    REQUIRE(c.isSafe(s) == false);
}

TEST_CASE("Transitions enforce G->Y->R and R->G", "[safety][transition]")
{
    SafetyChecker c;
    IntersectionState prev;
    prev.north_south = LightState::Green;

    IntersectionState toYellow = prev;
    toYellow.north_south = LightState::Yellow;
    REQUIRE(c.isValidTransition(prev, toYellow) == true);

    IntersectionState toRed = toYellow;
    toRed.north_south = LightState::Red;
    REQUIRE(c.isValidTransition(toYellow, toRed) == true);

    // direct green->red is invalid
    IntersectionState direct = prev;
    direct.north_south = LightState::Red;
    REQUIRE(c.isValidTransition(prev, direct) == false);

    // red->green is valid when the other axis is red
    IntersectionState green = toRed;
    green.east_west = LightState::Green;
    REQUIRE(c.isValidTransition(toRed, green) == true);

    // but not while the other axis is still active
    IntersectionState both = toYellow;
    both.east_west = LightState::Green;
    REQUIRE(c.isValidTransition(toYellow, both) == false);
}

TEST_CASE("Walk signal transitions follow walk, flash, stop", "[safety][transition]")
{
    SafetyChecker c;
    IntersectionState red;
    IntersectionState walk = red;
    walk.pedestrians = WalkState::Walk;
    IntersectionState flash = red;
    flash.pedestrians = WalkState::Flashing;

    REQUIRE(c.isValidTransition(red, walk));
    REQUIRE(c.isValidTransition(walk, flash));
    REQUIRE(c.isValidTransition(flash, red));
    REQUIRE_FALSE(c.isValidTransition(walk, red));
    REQUIRE_FALSE(c.isValidTransition(red, flash));
}

TEST_CASE("Every tick of the signal cycle is safe and legal", "[safety]")
{
    SafetyChecker checker;
    SignalController signal;
    IntersectionState last = signal.getCurrentState();

    for (int i = 0; i < 30 * 92 * 3; ++i)
    {
        signal.advance(1.0 / 30.0);
        IntersectionState state = signal.getCurrentState();
        REQUIRE(checker.isSafe(state));
        REQUIRE(checker.isValidTransition(last, state));
        last = state;
    }
}

TEST_CASE("Following audit counts followers inside the gap", "[safety]")
{
    SafetyChecker checker;
    KinematicsConfig config;
    EntityStore store;

    // Leader rear edge at 76; follower front edge at 72 leaves only 4 units
    store.insert(makeTrafficEntity(EntityKind::Vehicle, Heading::South, 0, Vec2{204.0, 88.0}, 50.0, 24.0));
    store.insert(makeTrafficEntity(EntityKind::Vehicle, Heading::South, 0, Vec2{204.0, 60.0}, 50.0, 24.0));
    REQUIRE(checker.countFollowingViolations(store, config) == 1);

    // A cyclist only needs 4 units
    store.clear();
    store.insert(makeTrafficEntity(EntityKind::Vehicle, Heading::South, 0, Vec2{204.0, 88.0}, 50.0, 24.0));
    store.insert(makeTrafficEntity(EntityKind::Cyclist, Heading::South, 0, Vec2{204.0, 62.0}, 30.0, 20.0));
    REQUIRE(checker.countFollowingViolations(store, config) == 0);

    // Other lanes and headings are not followers
    store.insert(makeTrafficEntity(EntityKind::Vehicle, Heading::South, 1, Vec2{228.0, 80.0}, 50.0, 24.0));
    store.insert(makeTrafficEntity(EntityKind::Vehicle, Heading::North, 0, Vec2{204.0, 80.0}, 50.0, 24.0));
    REQUIRE(checker.countFollowingViolations(store, config) == 0);
}

TEST_CASE("Following audit uses the same leader as the kinematics", "[safety]")
{
    SafetyChecker checker;
    KinematicsConfig config;
    EntityStore store;

    // Level bodies: neither is ahead of the other, so neither follows
    EntityId left = store.insert(makeTrafficEntity(EntityKind::Vehicle, Heading::East, 0, Vec2{100.0, 252.0}, 50.0, 24.0));
    EntityId right = store.insert(makeTrafficEntity(EntityKind::Cyclist, Heading::East, 0, Vec2{100.0, 252.0}, 30.0, 20.0));
    const std::vector<const Entity *> traffic = trafficEntities(store);
    REQUIRE(findLeader(*store.find(left), traffic) == nullptr);
    REQUIRE(findLeader(*store.find(right), traffic) == nullptr);
    REQUIRE(checker.countFollowingViolations(store, config) == 0);

    // A third body just ahead leads both and is too close to both
    EntityId front = store.insert(makeTrafficEntity(EntityKind::Vehicle, Heading::East, 0, Vec2{125.0, 252.0}, 50.0, 24.0));
    const std::vector<const Entity *> with_front = trafficEntities(store);
    REQUIRE(findLeader(*store.find(left), with_front) == store.find(front));
    REQUIRE(findLeader(*store.find(right), with_front) == store.find(front));
    REQUIRE(checker.countFollowingViolations(store, config) == 2);
}
