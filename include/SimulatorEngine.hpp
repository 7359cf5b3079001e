#pragma once

#include "EntityStore.hpp"
#include "Kinematics.hpp"
#include "SafetyChecker.hpp"
#include "ScreenSignCycle.hpp"
#include "SignalController.hpp"
#include "SimulationConfig.hpp"
#include "Spawner.hpp"
#include "TextureCatalog.hpp"
#include "TimeOfDay.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scramble
{
    struct SimulatorMetrics
    {
        double total_time = 0.0;
        uint64_t ticks = 0;
        std::size_t vehicles_spawned = 0;
        std::size_t cyclists_spawned = 0;
        std::size_t pedestrians_spawned = 0;
        std::size_t spawns_skipped = 0;
        std::size_t entities_despawned = 0;
        std::size_t live_vehicles = 0;
        std::size_t live_cyclists = 0;
        std::size_t live_pedestrians = 0;
        std::size_t stopped_traffic = 0;
        std::size_t waiting_pedestrians = 0;
        std::size_t safety_violations = 0;
        std::size_t following_violations = 0;
    };

    // What the renderer needs for one entity.
    struct EntityView
    {
        EntityId id = 0;
        EntityKind kind = EntityKind::Vehicle;
        std::string variant;
        std::string texture_key;
        Vec2 position;
        Heading heading = Heading::South;
        ActivityState activity = ActivityState::Moving;
        SpeedState speed_state = SpeedState::Cruising;
        double speed = 0.0;
        int anim_frame = 0;
    };

    struct SimulatorSnapshot
    {
        double sim_time = 0.0;
        bool running = false;
        TrafficPhase phase = TrafficPhase::NS_GREEN;
        double phase_elapsed = 0.0;
        IntersectionState lights;
        double time_of_day = 12.0;
        LightingPeriod lighting = LightingPeriod::Day;
        LightingTint tint;
        ScreenSignFrame screen_sign;
        SimulatorMetrics metrics;
        std::vector<EntityView> entities;
    };

    class SimulatorEngine
    {
    public:
        enum class UICommand
        {
            Start,
            Stop,
            Reset,
            Step
        };

        // A null catalog selects makeDefaultTextureCatalog().
        explicit SimulatorEngine(const SimulationConfig &config = makeDefaultSimulationConfig(),
                                 std::shared_ptr<const ITextureCatalog> textures = nullptr);

        void simulate(double duration_seconds, double time_step = 1.0 / 30.0);

        // One fixed-order tick: signal clock, spawner, kinematics, reaping, then presentation
        // state (textures, clock, screen sign) and the safety audit. Does nothing while stopped.
        void tick(double dt);

        SimulatorMetrics getMetrics() const;
        SimulatorSnapshot getSnapshot() const;
        std::string getSnapshotJson() const;

        void reset();
        void start();
        void stop();
        bool isRunning() const;
        // Step advances by `dt`; the single-argument form steps by tickInterval().
        void handleCommand(UICommand command, double dt);
        void handleCommand(UICommand command);

        // Rebuilds every component from `config` and resets the simulation.
        void applyConfig(const SimulationConfig &config);
        const SimulationConfig &getConfig() const { return config; }

        // Seconds per tick at the configured tick rate.
        double tickInterval() const { return 1.0 / config.tick_rate_hz; }

        // Off disables the spawner entirely, e.g. for scripted scenarios.
        void setSpawningEnabled(bool enabled) { spawning_enabled = enabled; }
        void setReleaseHook(EntityStore::ReleaseHook hook) { store.setReleaseHook(std::move(hook)); }

        EntityStore &getStore() { return store; }
        const EntityStore &getStore() const { return store; }
        const SignalController &getSignal() const { return signal; }
        const KinematicsEngine &getKinematics() const { return kinematics; }
        Spawner &getSpawner() { return spawner; }
        const TimeOfDay &getTimeOfDay() const { return time_of_day; }
        const ScreenSignCycle &getScreenSign() const { return screen_sign; }
        const ITextureCatalog &getTextures() const { return *textures; }

    private:
        void refreshTextureKeys();
        void auditSafety();

        SimulationConfig config;
        std::shared_ptr<const ITextureCatalog> textures;
        SafetyChecker checker;
        SignalController signal;
        KinematicsEngine kinematics;
        Spawner spawner;
        EntityStore store;
        TimeOfDay time_of_day;
        ScreenSignCycle screen_sign;
        IntersectionState last_lights;

        double current_time = 0.0;
        uint64_t ticks = 0;
        bool running = false;
        bool spawning_enabled = true;
        std::size_t entities_despawned = 0;
        std::size_t safety_violations = 0;
        std::size_t following_violations = 0;
    };

    std::optional<SimulatorEngine::UICommand> commandFromString(const std::string &value);

} // namespace scramble
