#include <catch2/catch.hpp>
#include <cmath>
#include <memory>
#include <set>
#include "Kinematics.hpp"
#include "Spawner.hpp"

using namespace scramble;

namespace
{
    constexpr double kDt = 1.0 / 30.0;

    std::shared_ptr<const ITextureCatalog> defaultTextures()
    {
        return std::make_shared<TextureCatalog>(makeDefaultTextureCatalog());
    }

    // Advances `signal` until it shows `phase`.
    void advanceTo(SignalController &signal, TrafficPhase phase)
    {
        while (signal.phase() != phase)
        {
            signal.advance(signal.phaseDuration(signal.phase()) - signal.phaseElapsed());
        }
    }

    bool isInsideCorner(const SceneLayout &layout, Vec2 point)
    {
        for (int i = 0; i < 4; ++i)
        {
            Vec2 corner = layout.cornerPoint(static_cast<Corner>(i));
            if (std::abs(point.x - corner.x) <= 3.0 && std::abs(point.y - corner.y) <= 3.0)
            {
                return true;
            }
        }
        return false;
    }
}

TEST_CASE("Vehicles spawn outside the scene in a lane of their direction", "[spawner]")
{
    const SceneLayout layout = makeDefaultSceneLayout();
    Spawner spawner(layout, SpawnerConfig{}, defaultTextures());

    std::set<std::string> types;
    for (int i = 0; i < 200; ++i)
    {
        EntityStore store;
        std::optional<EntityId> id = spawner.spawnVehicle(store);
        REQUIRE(id.has_value());

        const Entity &car = *store.find(*id);
        REQUIRE(car.kind == EntityKind::Vehicle);
        REQUIRE(isCardinal(car.heading));
        REQUIRE(isOffScene(layout, car.position, 0.0));

        const std::array<int, 2> lanes = vehicleLanesFor(layout, car.heading);
        const int lane = car.vehicleData()->lane;
        REQUIRE((lane == lanes[0] || lane == lanes[1]));

        std::optional<TextureInfo> texture = makeDefaultTextureCatalog().find(car.texture_key);
        REQUIRE(texture.has_value());
        const double expected_length = axisOf(car.heading) == Axis::NorthSouth ? texture->height : texture->width;
        REQUIRE(car.vehicleData()->length == expected_length);

        const double base = car.variant == "bus" ? 35.0 : car.variant == "kei_truck" ? 40.0 : 50.0;
        REQUIRE(car.cruise_speed >= base - 2.0);
        REQUIRE(car.cruise_speed <= base + 2.0);
        REQUIRE(car.speed == car.cruise_speed);
        types.insert(car.variant);
    }

    REQUIRE(types.count("sedan") == 1);
    REQUIRE(types.count("taxi") == 1);
    REQUIRE(types.size() >= 4);
}

TEST_CASE("Cyclists ride the curb lane", "[spawner]")
{
    const SceneLayout layout = makeDefaultSceneLayout();
    Spawner spawner(layout, SpawnerConfig{}, defaultTextures());

    for (int i = 0; i < 50; ++i)
    {
        EntityStore store;
        std::optional<EntityId> id = spawner.spawnCyclist(store);
        REQUIRE(id.has_value());
        const Entity &cyclist = *store.find(*id);
        REQUIRE(cyclist.kind == EntityKind::Cyclist);
        REQUIRE(cyclist.vehicleData()->lane == curbLaneFor(layout, cyclist.heading));
        REQUIRE((cyclist.variant == "commuter" || cyclist.variant == "delivery"));
        REQUIRE(cyclist.cruise_speed >= 28.0);
        REQUIRE(cyclist.cruise_speed <= 32.0);
        REQUIRE(cyclist.texture_key == cyclistTextureKey(cyclist.variant, cyclist.heading, 0));
    }
}

TEST_CASE("Spawns are rejected without clearance at the entry point", "[spawner]")
{
    const SceneLayout layout = makeDefaultSceneLayout();
    SpawnerConfig config;
    Spawner spawner(layout, config, defaultTextures());

    EntityStore store;
    const Vec2 entry = spawner.spawnPoint(Heading::South, 0, config.vehicle_spawn_offset);
    REQUIRE(entry.y == Catch::Detail::Approx(-40.0));
    REQUIRE(entry.x == Catch::Detail::Approx(layout.nsLaneX(0)));

    store.insert(makeTrafficEntity(EntityKind::Vehicle, Heading::South, 0,
                                   Vec2{entry.x, entry.y + 20.0}, 50.0, 24.0));

    REQUIRE_FALSE(spawner.hasClearance(store, Heading::South, entry));
    REQUIRE(spawner.hasClearance(store, Heading::South, spawner.spawnPoint(Heading::South, 1, 40.0)));
    REQUIRE(spawner.hasClearance(store, Heading::North, spawner.spawnPoint(Heading::North, 3, 40.0)));
    REQUIRE(spawner.hasClearance(store, Heading::South, Vec2{entry.x, entry.y - 30.0}));

    // Keep spawning until a southbound attempt is blocked by the parked car
    for (int i = 0; i < 200 && spawner.getStats().rejected_for_clearance == 0; ++i)
    {
        EntityStore single;
        single.insert(*store.find(1));
        spawner.spawnVehicle(single);
    }
    REQUIRE(spawner.getStats().rejected_for_clearance > 0);
}

TEST_CASE("Spawns with no texture are skipped", "[spawner]")
{
    const SceneLayout layout = makeDefaultSceneLayout();
    auto empty = std::make_shared<TextureCatalog>();
    Spawner spawner(layout, SpawnerConfig{}, empty);
    EntityStore store;

    REQUIRE_FALSE(spawner.spawnVehicle(store).has_value());
    REQUIRE_FALSE(spawner.spawnCyclist(store).has_value());
    REQUIRE_FALSE(spawner.spawnPedestrian(store).has_value());
    REQUIRE(store.empty());
    REQUIRE(spawner.getStats().skipped_missing_texture == 3);

    // Only buses have sprites: every other vehicle type is skipped
    auto buses_only = std::make_shared<TextureCatalog>();
    for (Heading heading : kCardinalHeadings)
    {
        buses_only->add(vehicleTextureKey("bus", heading), 16, 40);
    }
    Spawner bus_spawner(layout, SpawnerConfig{}, buses_only);
    for (int i = 0; i < 100; ++i)
    {
        EntityStore fresh;
        if (auto id = bus_spawner.spawnVehicle(fresh))
        {
            REQUIRE(fresh.find(*id)->variant == "bus");
        }
    }
    REQUIRE(bus_spawner.getStats().vehicles_spawned > 0);
    REQUIRE(bus_spawner.getStats().skipped_missing_texture > 0);
}

TEST_CASE("Pedestrian paths have the expected shape", "[spawner][pedestrian]")
{
    const SceneLayout layout = makeDefaultSceneLayout();
    Spawner spawner(layout, SpawnerConfig{}, defaultTextures());

    for (int i = 0; i < 40; ++i)
    {
        std::vector<Waypoint> sidewalk = spawner.sidewalkPath();
        REQUIRE(sidewalk.size() == 3);
        for (const auto &point : sidewalk)
        {
            REQUIRE_FALSE(point.wait_for_signal);
        }
        REQUIRE(isInsideCorner(layout, sidewalk[1].position));

        std::vector<Waypoint> crossing = spawner.crossingPath();
        REQUIRE(crossing.size() == 4);
        REQUIRE(crossing[1].wait_for_signal);
        REQUIRE_FALSE(crossing[2].wait_for_signal);
        REQUIRE(isInsideCorner(layout, crossing[1].position));
        REQUIRE(isInsideCorner(layout, crossing[2].position));
        REQUIRE(isOffScene(layout, crossing.front().position, 0.0));
        REQUIRE(isOffScene(layout, crossing.back().position, 0.0));

        std::vector<Waypoint> diagonal = spawner.diagonalPath();
        REQUIRE(diagonal.size() == 4);
        REQUIRE(diagonal[1].wait_for_signal);
        // Opposite corners differ on both axes
        REQUIRE(std::abs(diagonal[1].position.x - diagonal[2].position.x) > 100.0);
        REQUIRE(std::abs(diagonal[1].position.y - diagonal[2].position.y) > 100.0);

        std::vector<Waypoint> waiting = spawner.waitingCrosserPath();
        REQUIRE(waiting.size() == 4);
        REQUIRE(waiting[0].position.x == waiting[1].position.x);
        REQUIRE(waiting[0].position.y == waiting[1].position.y);
        REQUIRE_FALSE(waiting[0].wait_for_signal);
        REQUIRE(waiting[1].wait_for_signal);
    }
}

TEST_CASE("Pedestrian spawns respect the live cap", "[spawner][pedestrian]")
{
    const SceneLayout layout = makeDefaultSceneLayout();
    SpawnerConfig config;
    config.max_pedestrians = 3;
    Spawner spawner(layout, config, defaultTextures());
    EntityStore store;

    for (int i = 0; i < 10; ++i)
    {
        spawner.spawnPedestrian(store);
    }
    REQUIRE(store.countByKind(EntityKind::Pedestrian) == 3);
    REQUIRE(spawner.spawnBurst(store) == 0);
    REQUIRE_FALSE(spawner.spawnPedestrianOnPath(store, {}).has_value());
}

TEST_CASE("Pedestrians start facing their first leg", "[spawner][pedestrian]")
{
    const SceneLayout layout = makeDefaultSceneLayout();
    Spawner spawner(layout, SpawnerConfig{}, defaultTextures());
    EntityStore store;

    std::optional<EntityId> id = spawner.spawnPedestrianOnPath(store, {{{100.0, 100.0}, false}, {{100.0, 200.0}, false}});
    REQUIRE(id.has_value());
    const Entity &walker = *store.find(*id);
    REQUIRE(walker.heading == Heading::South);
    REQUIRE(walker.texture_key == pedestrianTextureKey(walker.variant, Heading::South, 0));
    REQUIRE(walker.position.x == 100.0);
    REQUIRE(walker.cruise_speed >= 18.0);
    REQUIRE(walker.cruise_speed <= 28.0);
}

TEST_CASE("Spawn timers fire on their intervals", "[spawner]")
{
    const SceneLayout layout = makeDefaultSceneLayout();
    SpawnerConfig config;
    config.burst_enabled = false;
    config.pedestrian_mode = PedestrianSpawnMode::Wave;
    Spawner spawner(layout, config, defaultTextures());
    SignalController signal;
    EntityStore store;

    REQUIRE(spawner.nextVehicleInterval() >= 2.0);
    REQUIRE(spawner.nextVehicleInterval() < 3.0);

    for (int i = 0; i < 59; ++i)
    {
        spawner.update(kDt, signal, store);
    }
    REQUIRE(store.empty());

    // 30 seconds allow 9 to 15 vehicle attempts and 2 to 3 cyclist attempts
    for (int i = 0; i < 30 * 30 - 59; ++i)
    {
        spawner.update(kDt, signal, store);
    }
    const SpawnerStats &stats = spawner.getStats();
    const std::size_t attempts = stats.vehicles_spawned + stats.cyclists_spawned +
                                 stats.rejected_for_clearance + stats.skipped_missing_texture;
    REQUIRE(stats.vehicles_spawned > 0);
    REQUIRE(stats.skipped_missing_texture == 0);
    REQUIRE(attempts >= 11);
    REQUIRE(attempts <= 18);
    REQUIRE(stats.pedestrians_spawned == 0);
}

TEST_CASE("Scramble wave spawns once per phase occurrence", "[spawner][pedestrian]")
{
    const SceneLayout layout = makeDefaultSceneLayout();
    SpawnerConfig config;
    config.pedestrian_mode = PedestrianSpawnMode::Wave;
    config.burst_enabled = false;
    Spawner spawner(layout, config, defaultTextures());
    SignalController signal;
    EntityStore store;

    advanceTo(signal, TrafficPhase::SCRAMBLE);
    for (int i = 0; i < 30 * 5; ++i)
    {
        spawner.update(kDt, signal, store);
    }

    REQUIRE(spawner.getStats().waves == 1);
    const std::size_t wave = store.countByKind(EntityKind::Pedestrian);
    REQUIRE(wave >= 15);
    REQUIRE(wave <= 25);

    for (const auto &entry : store)
    {
        const Entity &entity = entry.second;
        if (entity.kind != EntityKind::Pedestrian)
        {
            continue;
        }
        const PedestrianData *data = entity.pedestrianData();
        REQUIRE(data->path[1].wait_for_signal);
        REQUIRE(isInsideCorner(layout, entity.position));
    }

    // Next scramble, next wave
    advanceTo(signal, TrafficPhase::ALL_RED_3);
    spawner.update(kDt, signal, store);
    advanceTo(signal, TrafficPhase::SCRAMBLE);
    spawner.update(kDt, signal, store);
    spawner.update(kDt, signal, store);
    REQUIRE(spawner.getStats().waves == 2);
}

TEST_CASE("Burst of waiting crossers arrives when ALL_RED_2 begins", "[spawner][pedestrian]")
{
    const SceneLayout layout = makeDefaultSceneLayout();
    SpawnerConfig config;
    config.pedestrian_mode = PedestrianSpawnMode::Wave;
    Spawner spawner(layout, config, defaultTextures());
    SignalController signal;
    EntityStore store;

    advanceTo(signal, TrafficPhase::ALL_RED_2);
    for (int i = 0; i < 30; ++i)
    {
        spawner.update(kDt, signal, store);
    }

    REQUIRE(spawner.getStats().bursts == 1);
    REQUIRE(spawner.getStats().waves == 0);
    const std::size_t burst = store.countByKind(EntityKind::Pedestrian);
    REQUIRE(burst >= 6);
    REQUIRE(burst <= 10);

    config.burst_enabled = false;
    Spawner quiet(layout, config, defaultTextures());
    EntityStore quiet_store;
    quiet.update(kDt, signal, quiet_store);
    REQUIRE(quiet.getStats().bursts == 0);
}

TEST_CASE("Continuous mode never spawns a scramble wave", "[spawner][pedestrian]")
{
    const SceneLayout layout = makeDefaultSceneLayout();
    Spawner spawner(layout, SpawnerConfig{}, defaultTextures());
    SignalController signal;
    EntityStore store;

    advanceTo(signal, TrafficPhase::SCRAMBLE);
    spawner.update(kDt, signal, store);
    REQUIRE(spawner.getStats().waves == 0);
}

TEST_CASE("Spawners with the same seed produce the same scene", "[spawner]")
{
    const SceneLayout layout = makeDefaultSceneLayout();
    SpawnerConfig config;
    config.seed = 1234;

    Spawner first(layout, config, defaultTextures());
    Spawner second(layout, config, defaultTextures(), std::mt19937(1234));
    SignalController signal;
    EntityStore first_store;
    EntityStore second_store;

    for (int i = 0; i < 30 * 120; ++i)
    {
        signal.advance(kDt);
        first.update(kDt, signal, first_store);
        second.update(kDt, signal, second_store);
    }

    REQUIRE(first_store.size() == second_store.size());
    REQUIRE(first_store.size() > 0);
    for (const auto &entry : first_store)
    {
        const Entity *other = second_store.find(entry.first);
        REQUIRE(other != nullptr);
        REQUIRE(other->variant == entry.second.variant);
        REQUIRE(other->texture_key == entry.second.texture_key);
        REQUIRE(other->position.x == entry.second.position.x);
        REQUIRE(other->position.y == entry.second.position.y);
        REQUIRE(other->cruise_speed == entry.second.cruise_speed);
    }

    // Reset replays the same sequence
    EntityStore replay;
    first.reset();
    SignalController replay_signal;
    for (int i = 0; i < 30 * 120; ++i)
    {
        replay_signal.advance(kDt);
        first.update(kDt, replay_signal, replay);
    }
    REQUIRE(replay.size() == second_store.size());
    REQUIRE(replay.find(1)->texture_key == second_store.find(1)->texture_key);
}
