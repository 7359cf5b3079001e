#pragma once

#include "Entity.hpp"
#include "EntityStore.hpp"
#include "SceneLayout.hpp"
#include "SignalController.hpp"
#include "SimulationConfig.hpp"

#include <optional>
#include <vector>

namespace scramble
{
    // Geometry helpers. "Progress" is the coordinate along a cardinal travel axis, increasing in
    // the direction of travel, so "ahead" always means "larger progress".
    Vec2 unitVector(Heading heading);
    double progressAlong(Heading heading, Vec2 position);
    double frontEdge(const Entity &entity);
    double rearEdge(const Entity &entity);
    double stopLineProgress(const SceneLayout &layout, Heading heading);

    // Positive while `target_progress` is still ahead of the entity's front edge.
    double signedDistanceToTarget(const Entity &entity, double target_progress);

    bool isOffScene(const SceneLayout &layout, Vec2 position, double margin);

    // Quantizes a screen-space vector (y down) to the nearest of 8 compass headings.
    Heading quantizeHeading(double dx, double dy);

    // Vehicles and cyclists in the store, in creation order.
    std::vector<const Entity *> trafficEntities(const EntityStore &store);

    // Nearest same-lane, same-heading traffic entity ahead of `entity`, or nullptr. "Ahead" compares
    // body centers; lengths only enter through the rear-edge target. `candidates` may include
    // `entity` itself.
    const Entity *findLeader(const Entity &entity, const std::vector<const Entity *> &candidates);

    class KinematicsEngine
    {
    public:
        using Neighbours = std::vector<const Entity *>;

        KinematicsEngine(const SceneLayout &layout, const KinematicsConfig &config);

        // Runs one tick for every entity in the store. Despawning entities are only marked here;
        // removal is the caller's job once the pass is complete.
        void step(EntityStore &store, const SignalController &signal, double dt_seconds) const;

        // Car-following update for a vehicle or cyclist. `neighbours` are the traffic entities
        // the leader search may consider (the entity itself may be among them).
        void updateTraffic(Entity &entity, const Neighbours &neighbours,
                           const SignalController &signal, double dt_seconds) const;

        void updatePedestrian(Entity &entity, const SignalController &signal, double dt_seconds) const;

        // Furthest point the front edge may reach this tick, or nullopt on an open road.
        std::optional<double> targetFrontProgress(const Entity &entity, const Neighbours &neighbours,
                                                  const SignalController &signal) const;

        bool isBlockedByLight(const Entity &entity, const SignalController &signal) const;

        double brakingDistance(double speed) const;

        // Highest speed to travel at this tick such that shedding `deceleration * dt` per tick
        // afterwards brings the front edge to rest exactly `distance` ahead.
        double approachSpeedLimit(double distance, double dt_seconds) const;
        double followingGap(EntityKind kind) const;

        const KinematicsConfig &getConfig() const { return config; }

    private:
        SceneLayout layout;
        KinematicsConfig config;
    };

} // namespace scramble
