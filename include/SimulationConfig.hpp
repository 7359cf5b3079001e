#pragma once

#include "SceneLayout.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace scramble
{
    // Phase durations in seconds, in cycle order.
    struct SignalTimingConfig
    {
        double ns_green = 25.0;
        double ns_yellow = 3.0;
        double all_red_1 = 2.0;
        double ew_green = 25.0;
        double ew_yellow = 3.0;
        double all_red_2 = 2.0;
        double scramble = 25.0;
        double scramble_flash = 5.0;
        double all_red_3 = 2.0;
    };

    struct KinematicsConfig
    {
        double deceleration = 120.0; // units/s^2
        double acceleration = 80.0;  // units/s^2
        double vehicle_following_gap = 6.0;
        double cyclist_following_gap = 4.0;
        double departure_threshold = 12.0;
        double yellow_commit_distance = 30.0;
        double pedestrian_arrival_radius = 3.0;
        double flashing_speed_factor = 1.3;
        double off_scene_margin = 60.0;
        bool double_buffered = false;
    };

    enum class PedestrianSpawnMode : uint8_t
    {
        Continuous,
        Wave
    };

    struct PathWeights
    {
        double sidewalk = 0.35;
        double crossing = 0.50;
        double diagonal = 0.15;
    };

    struct SpawnerConfig
    {
        uint32_t seed = 0x5eed;

        double vehicle_interval_min = 2.0;
        double vehicle_interval_max = 3.0;
        double vehicle_spawn_offset = 40.0;  // distance outside the scene edge
        double vehicle_spawn_clearance = 40.0;

        double cyclist_interval_min = 8.0;
        double cyclist_interval_max = 10.0;
        double cyclist_spawn_offset = 24.0;

        PedestrianSpawnMode pedestrian_mode = PedestrianSpawnMode::Continuous;
        double pedestrian_interval_min = 1.2;
        double pedestrian_interval_max = 1.7;
        std::size_t max_pedestrians = 60;
        PathWeights path_weights;

        std::size_t wave_min = 15;
        std::size_t wave_max = 25;

        bool burst_enabled = true;
        std::size_t burst_min = 6;
        std::size_t burst_max = 10;
    };

    struct SimulationConfig
    {
        SceneLayout layout;
        SignalTimingConfig signal;
        KinematicsConfig kinematics;
        SpawnerConfig spawner;
        double tick_rate_hz = 30.0;
        double start_time_of_day = 12.0;
    };

    inline SimulationConfig makeDefaultSimulationConfig()
    {
        return SimulationConfig{};
    }

    inline const char *toString(PedestrianSpawnMode mode)
    {
        return mode == PedestrianSpawnMode::Wave ? "wave" : "continuous";
    }

} // namespace scramble
