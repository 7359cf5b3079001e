#include "SimulatorEngine.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace scramble
{
    namespace
    {
        std::shared_ptr<const ITextureCatalog> orDefaultCatalog(std::shared_ptr<const ITextureCatalog> textures)
        {
            if (textures)
            {
                return textures;
            }
            return std::make_shared<TextureCatalog>(makeDefaultTextureCatalog());
        }
    }

    SimulatorEngine::SimulatorEngine(const SimulationConfig &config, std::shared_ptr<const ITextureCatalog> textures)
        : config(config),
          textures(orDefaultCatalog(std::move(textures))),
          signal(config.signal),
          kinematics(config.layout, config.kinematics),
          spawner(config.layout, config.spawner, this->textures),
          time_of_day(config.start_time_of_day),
          last_lights(signal.getCurrentState())
    {
    }

    void SimulatorEngine::simulate(double duration_seconds, double time_step)
    {
        reset();
        start();
        while (current_time < duration_seconds)
            tick(time_step);
        stop();
    }

    void SimulatorEngine::tick(double dt)
    {
        if (!running)
        {
            return;
        }

        signal.advance(dt);

        if (spawning_enabled)
        {
            spawner.update(dt, signal, store);
        }

        kinematics.step(store, signal, dt);

        // Despawning entities leave only after every entity has been updated
        entities_despawned += store.reapDespawned().size();

        refreshTextureKeys();
        time_of_day.advance(dt);
        screen_sign.advance(dt);
        auditSafety();

        current_time += dt;
        ticks += 1;
    }

    void SimulatorEngine::refreshTextureKeys()
    {
        for (auto &entry : store)
        {
            entry.second.texture_key = animatedTextureKey(entry.second);
        }
    }

    void SimulatorEngine::auditSafety()
    {
        IntersectionState lights = signal.getCurrentState();
        if (!checker.isSafe(lights) || !checker.isValidTransition(last_lights, lights))
        {
            safety_violations++;
        }
        last_lights = lights;

        following_violations += checker.countFollowingViolations(store, config.kinematics);
    }

    SimulatorMetrics SimulatorEngine::getMetrics() const
    {
        SimulatorMetrics metrics;
        metrics.total_time = current_time;
        metrics.ticks = ticks;

        const SpawnerStats &stats = spawner.getStats();
        metrics.vehicles_spawned = stats.vehicles_spawned;
        metrics.cyclists_spawned = stats.cyclists_spawned;
        metrics.pedestrians_spawned = stats.pedestrians_spawned;
        metrics.spawns_skipped = stats.skipped_missing_texture + stats.rejected_for_clearance;
        metrics.entities_despawned = entities_despawned;

        for (const auto &entry : store)
        {
            const Entity &entity = entry.second;
            switch (entity.kind)
            {
            case EntityKind::Vehicle:
                metrics.live_vehicles++;
                break;
            case EntityKind::Cyclist:
                metrics.live_cyclists++;
                break;
            case EntityKind::Pedestrian:
                metrics.live_pedestrians++;
                if (entity.activity == ActivityState::Waiting)
                {
                    metrics.waiting_pedestrians++;
                }
                break;
            }
            if (entity.isTraffic() && entity.speed_state == SpeedState::Stopped)
            {
                metrics.stopped_traffic++;
            }
        }

        metrics.safety_violations = safety_violations;
        metrics.following_violations = following_violations;
        return metrics;
    }

    SimulatorSnapshot SimulatorEngine::getSnapshot() const
    {
        SimulatorSnapshot snapshot;
        snapshot.sim_time = current_time;
        snapshot.running = running;
        snapshot.phase = signal.phase();
        snapshot.phase_elapsed = signal.phaseElapsed();
        snapshot.lights = signal.getCurrentState();
        snapshot.time_of_day = time_of_day.hour();
        snapshot.lighting = time_of_day.period();
        snapshot.tint = time_of_day.tint();
        snapshot.screen_sign = screen_sign.frame(snapshot.time_of_day);
        snapshot.metrics = getMetrics();

        snapshot.entities.reserve(store.size());
        for (const auto &entry : store)
        {
            const Entity &entity = entry.second;
            EntityView view;
            view.id = entity.id;
            view.kind = entity.kind;
            view.variant = entity.variant;
            view.texture_key = entity.texture_key;
            view.position = entity.position;
            view.heading = entity.heading;
            view.activity = entity.activity;
            view.speed_state = entity.speed_state;
            view.speed = entity.speed;
            view.anim_frame = entity.anim_frame;
            snapshot.entities.push_back(view);
        }
        return snapshot;
    }

    std::string SimulatorEngine::getSnapshotJson() const
    {
        using nlohmann::json;

        SimulatorSnapshot snapshot = getSnapshot();
        json root;
        root["sim_time"] = snapshot.sim_time;
        root["running"] = snapshot.running;

        root["signal"] = {
            {"phase", toString(snapshot.phase)},
            {"phase_elapsed", snapshot.phase_elapsed},
            {"north_south", toString(snapshot.lights.north_south)},
            {"east_west", toString(snapshot.lights.east_west)},
            {"pedestrians", toString(snapshot.lights.pedestrians)},
            {"walk_lamp_lit", snapshot.lights.walk_lamp_lit},
            {"vehicle_ns_texture", vehicleSignalTextureKey(snapshot.lights.north_south)},
            {"vehicle_ew_texture", vehicleSignalTextureKey(snapshot.lights.east_west)},
            {"pedestrian_texture", pedestrianSignalTextureKey(snapshot.lights.pedestrians, snapshot.lights.walk_lamp_lit)},
        };

        root["lighting"] = {
            {"time_of_day", snapshot.time_of_day},
            {"period", toString(snapshot.lighting)},
            {"tint", {snapshot.tint.red, snapshot.tint.green, snapshot.tint.blue}},
            {"brightness", snapshot.tint.brightness},
        };

        const ScreenSignFrame &sign = snapshot.screen_sign;
        root["screen_sign"] = {
            {"texture", sign.texture_key},
            {"next_texture", sign.next_texture_key},
            {"fade_progress", sign.fade_progress},
            {"glow_color", sign.glow_color},
            {"glow_alpha", sign.glow_alpha},
            {"glow_height", sign.glow_height},
        };

        const SimulatorMetrics &metrics = snapshot.metrics;
        root["metrics"] = {
            {"ticks", metrics.ticks},
            {"vehicles_spawned", metrics.vehicles_spawned},
            {"cyclists_spawned", metrics.cyclists_spawned},
            {"pedestrians_spawned", metrics.pedestrians_spawned},
            {"spawns_skipped", metrics.spawns_skipped},
            {"entities_despawned", metrics.entities_despawned},
            {"live", {{"vehicles", metrics.live_vehicles}, {"cyclists", metrics.live_cyclists}, {"pedestrians", metrics.live_pedestrians}}},
            {"stopped_traffic", metrics.stopped_traffic},
            {"waiting_pedestrians", metrics.waiting_pedestrians},
            {"safety_violations", metrics.safety_violations},
            {"following_violations", metrics.following_violations},
        };

        json entities = json::array();
        for (const auto &view : snapshot.entities)
        {
            entities.push_back({
                {"id", view.id},
                {"kind", toString(view.kind)},
                {"variant", view.variant},
                {"texture", view.texture_key},
                {"x", view.position.x},
                {"y", view.position.y},
                {"heading", toString(view.heading)},
                {"activity", toString(view.activity)},
                {"speed_state", toString(view.speed_state)},
                {"speed", view.speed},
                {"frame", view.anim_frame},
            });
        }
        root["entities"] = entities;

        return root.dump();
    }

    void SimulatorEngine::reset()
    {
        current_time = 0.0;
        ticks = 0;
        running = false;
        entities_despawned = 0;
        safety_violations = 0;
        following_violations = 0;
        signal.reset();
        spawner.reset();
        store.clear();
        time_of_day.reset();
        screen_sign.reset();
        last_lights = signal.getCurrentState();
    }

    void SimulatorEngine::start()
    {
        running = true;
    }

    void SimulatorEngine::stop()
    {
        running = false;
    }

    bool SimulatorEngine::isRunning() const
    {
        return running;
    }

    void SimulatorEngine::handleCommand(UICommand command, double dt)
    {
        switch (command)
        {
        case UICommand::Start:
            start();
            break;
        case UICommand::Stop:
            stop();
            break;
        case UICommand::Reset:
            reset();
            break;
        case UICommand::Step:
            if (!running)
            {
                start();
                tick(dt);
                stop();
            }
            else
            {
                tick(dt);
            }
            break;
        }
    }

    void SimulatorEngine::handleCommand(UICommand command)
    {
        handleCommand(command, tickInterval());
    }

    void SimulatorEngine::applyConfig(const SimulationConfig &new_config)
    {
        config = new_config;
        signal = SignalController(config.signal);
        kinematics = KinematicsEngine(config.layout, config.kinematics);
        spawner = Spawner(config.layout, config.spawner, textures);
        time_of_day = TimeOfDay(config.start_time_of_day);
        reset();
    }

    std::optional<SimulatorEngine::UICommand> commandFromString(const std::string &value)
    {
        if (value == "start")
            return SimulatorEngine::UICommand::Start;
        if (value == "stop")
            return SimulatorEngine::UICommand::Stop;
        if (value == "reset")
            return SimulatorEngine::UICommand::Reset;
        if (value == "step")
            return SimulatorEngine::UICommand::Step;
        return std::nullopt;
    }

} // namespace scramble
