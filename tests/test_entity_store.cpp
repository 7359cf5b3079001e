#include <catch2/catch.hpp>
#include <vector>
#include "EntityStore.hpp"

using namespace scramble;

namespace
{
    Entity walker()
    {
        return makePedestrianEntity({{{0.0, 0.0}, false}, {{10.0, 0.0}, false}}, 25.0);
    }

    Entity car()
    {
        return makeTrafficEntity(EntityKind::Vehicle, Heading::East, 0, Vec2{0.0, 0.0}, 50.0, 24.0);
    }
}

TEST_CASE("Store assigns increasing ids and iterates in creation order", "[store]")
{
    EntityStore store;
    REQUIRE(store.empty());
    REQUIRE(store.peekNextId() == 1);

    EntityId a = store.insert(car());
    EntityId b = store.insert(walker());
    EntityId c = store.insert(car());
    REQUIRE(a == 1);
    REQUIRE(b == 2);
    REQUIRE(c == 3);
    REQUIRE(store.find(b)->id == b);
    REQUIRE(store.find(42) == nullptr);

    std::vector<EntityId> seen;
    for (const auto &entry : store)
    {
        seen.push_back(entry.second.id);
    }
    REQUIRE(seen == std::vector<EntityId>{1, 2, 3});

    REQUIRE(store.countByKind(EntityKind::Vehicle) == 2);
    REQUIRE(store.countByKind(EntityKind::Pedestrian) == 1);
    REQUIRE(store.countByKind(EntityKind::Cyclist) == 0);
}

TEST_CASE("Reaping removes only despawning entities and releases each once", "[store]")
{
    EntityStore store;
    std::vector<EntityId> released;
    store.setReleaseHook([&](const Entity &entity)
                         { released.push_back(entity.id); });

    store.insert(car());
    EntityId leaving = store.insert(walker());
    store.insert(car());
    EntityId also_leaving = store.insert(car());

    store.find(leaving)->activity = ActivityState::Despawning;
    store.find(also_leaving)->activity = ActivityState::Despawning;

    std::vector<EntityId> reaped = store.reapDespawned();
    REQUIRE(reaped == std::vector<EntityId>{leaving, also_leaving});
    REQUIRE(released == reaped);
    REQUIRE(store.size() == 2);
    REQUIRE(store.find(leaving) == nullptr);

    REQUIRE(store.reapDespawned().empty());
    REQUIRE(released.size() == 2);

    // Ids are never reused while the store lives
    REQUIRE(store.insert(walker()) == 5);
}

TEST_CASE("Erase and clear release entities", "[store]")
{
    EntityStore store;
    std::size_t releases = 0;
    store.setReleaseHook([&](const Entity &)
                         { releases++; });

    EntityId id = store.insert(car());
    store.insert(walker());
    REQUIRE(store.erase(id));
    REQUIRE_FALSE(store.erase(id));
    REQUIRE(releases == 1);

    store.clear();
    REQUIRE(releases == 2);
    REQUIRE(store.empty());
    REQUIRE(store.peekNextId() == 1);
}

TEST_CASE("Entity payload matches its kind", "[store]")
{
    Entity vehicle = car();
    REQUIRE(vehicle.isTraffic());
    REQUIRE(vehicle.vehicleData() != nullptr);
    REQUIRE(vehicle.pedestrianData() == nullptr);
    REQUIRE(vehicle.vehicleData()->length == 24.0);

    Entity pedestrian = walker();
    REQUIRE_FALSE(pedestrian.isTraffic());
    REQUIRE(pedestrian.vehicleData() == nullptr);
    REQUIRE(pedestrian.pedestrianData()->cursor == 1);
    REQUIRE(pedestrian.position.x == 0.0);
}
