#pragma once

#include "Entity.hpp"
#include "EntityStore.hpp"
#include "SceneLayout.hpp"
#include "SignalController.hpp"
#include "SimulationConfig.hpp"
#include "TextureCatalog.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace scramble
{
    struct SpawnerStats
    {
        std::size_t vehicles_spawned = 0;
        std::size_t cyclists_spawned = 0;
        std::size_t pedestrians_spawned = 0;
        std::size_t rejected_for_clearance = 0;
        std::size_t skipped_missing_texture = 0;
        std::size_t waves = 0;
        std::size_t bursts = 0;
    };

    // Keeps the scene populated. All randomness comes from the owned generator, so two spawners
    // built with the same seed and fed the same ticks produce the same entities.
    class Spawner
    {
    public:
        Spawner(const SceneLayout &layout,
                const SpawnerConfig &config,
                std::shared_ptr<const ITextureCatalog> textures);
        Spawner(const SceneLayout &layout,
                const SpawnerConfig &config,
                std::shared_ptr<const ITextureCatalog> textures,
                std::mt19937 rng);

        // Runs the spawn timers and the phase-triggered wave/burst for one tick.
        void update(double dt_seconds, const SignalController &signal, EntityStore &store);

        // Clears timers and phase tracking and reseeds the generator from the config.
        void reset();

        // Each spawn returns the new id, or nullopt when the spawn was skipped.
        std::optional<EntityId> spawnVehicle(EntityStore &store);
        std::optional<EntityId> spawnCyclist(EntityStore &store);
        std::optional<EntityId> spawnPedestrian(EntityStore &store);
        std::optional<EntityId> spawnPedestrianOnPath(EntityStore &store, std::vector<Waypoint> path);

        // Crossers already standing at a wait point. Return the number actually spawned.
        std::size_t spawnBurst(EntityStore &store);
        std::size_t spawnWave(EntityStore &store);

        // Path generators.
        std::vector<Waypoint> sidewalkPath();
        std::vector<Waypoint> crossingPath();
        std::vector<Waypoint> diagonalPath();
        std::vector<Waypoint> randomPedestrianPath();
        std::vector<Waypoint> waitingCrosserPath();

        Vec2 spawnPoint(Heading heading, int lane, double offset) const;
        bool hasClearance(const EntityStore &store, Heading heading, Vec2 point) const;

        const SpawnerStats &getStats() const { return stats; }
        const SpawnerConfig &getConfig() const { return config; }
        double nextVehicleInterval() const { return next_vehicle_interval; }

    private:
        double uniform(double min_value, double max_value);
        std::size_t uniformIndex(std::size_t count);
        std::size_t uniformCount(std::size_t min_value, std::size_t max_value);
        double jitter(double amount);
        void drawIntervals();

        Vec2 exitPoint(Corner corner);
        Vec2 jitteredCorner(Corner corner);
        std::optional<EntityId> spawnTraffic(EntityStore &store, EntityKind kind, Heading heading, int lane,
                                             const std::string &variant, const std::string &texture_key,
                                             double cruise_speed, double offset);

        SceneLayout layout;
        SpawnerConfig config;
        std::shared_ptr<const ITextureCatalog> textures;
        std::mt19937 rng;
        std::mt19937 initial_rng;

        double vehicle_timer = 0.0;
        double cyclist_timer = 0.0;
        double pedestrian_timer = 0.0;
        double next_vehicle_interval = 0.0;
        double next_cyclist_interval = 0.0;
        double next_pedestrian_interval = 0.0;

        std::optional<TrafficPhase> last_phase;
        bool group_spawned_this_phase = false;

        SpawnerStats stats;
    };

} // namespace scramble
