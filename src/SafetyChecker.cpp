#include "SafetyChecker.hpp"

#include "Kinematics.hpp"

#include <cmath>
#include <utility>

namespace scramble
{
    namespace
    {
        bool positive(double value)
        {
            return std::isfinite(value) && value > 0.0;
        }

        bool nonNegative(double value)
        {
            return std::isfinite(value) && value >= 0.0;
        }

        void checkRange(const char *name, double min_value, double max_value, std::vector<std::string> &errors)
        {
            if (!positive(min_value) || !positive(max_value))
            {
                errors.push_back(std::string(name) + " interval bounds must be positive");
            }
            else if (min_value > max_value)
            {
                errors.push_back(std::string(name) + " interval min must not exceed max");
            }
        }
    }

    bool SafetyChecker::isConfigValid(const SimulationConfig &config, std::vector<std::string> *errors) const
    {
        std::vector<std::string> found;
        checkLayout(config.layout, found);
        checkSignalTimings(config.signal, found);
        checkKinematics(config.kinematics, found);
        checkSpawner(config.spawner, found);

        if (!positive(config.tick_rate_hz))
        {
            found.push_back("tick_rate_hz must be positive");
        }
        if (!std::isfinite(config.start_time_of_day) || config.start_time_of_day < 0.0 || config.start_time_of_day >= 24.0)
        {
            found.push_back("start_time_of_day must be in [0, 24)");
        }

        if (errors)
        {
            errors->insert(errors->end(), found.begin(), found.end());
        }
        return found.empty();
    }

    void SafetyChecker::checkLayout(const SceneLayout &layout, std::vector<std::string> &errors) const
    {
        if (!positive(layout.scene_width) || !positive(layout.scene_height))
        {
            errors.push_back("layout scene size must be positive");
            return;
        }
        if (!positive(layout.lane_width) || !nonNegative(layout.zebra_width) || !nonNegative(layout.stop_line_setback))
        {
            errors.push_back("layout lane width must be positive and crosswalk offsets non-negative");
            return;
        }
        if (layout.lanes_per_road < 2 || layout.lanes_per_road % 2 != 0)
        {
            errors.push_back("layout lanes_per_road must be an even number of at least 2");
            return;
        }

        // Stop lines must stay inside the scene on every approach
        const double approach_depth = layout.roadWidth() + 2.0 * (layout.zebra_width + layout.stop_line_setback);
        if (approach_depth >= layout.scene_width || approach_depth >= layout.scene_height)
        {
            errors.push_back("layout roads, crosswalks and stop lines do not fit in the scene");
        }
    }

    void SafetyChecker::checkSignalTimings(const SignalTimingConfig &timings, std::vector<std::string> &errors) const
    {
        const std::pair<const char *, double> durations[] = {
            {"ns_green", timings.ns_green},
            {"ns_yellow", timings.ns_yellow},
            {"all_red_1", timings.all_red_1},
            {"ew_green", timings.ew_green},
            {"ew_yellow", timings.ew_yellow},
            {"all_red_2", timings.all_red_2},
            {"scramble", timings.scramble},
            {"scramble_flash", timings.scramble_flash},
            {"all_red_3", timings.all_red_3},
        };

        for (const auto &entry : durations)
        {
            if (!positive(entry.second))
            {
                errors.push_back(std::string("signal.") + entry.first + " must be positive");
            }
        }
    }

    void SafetyChecker::checkKinematics(const KinematicsConfig &kinematics, std::vector<std::string> &errors) const
    {
        if (!positive(kinematics.deceleration) || !positive(kinematics.acceleration))
        {
            errors.push_back("kinematics acceleration and deceleration must be positive");
        }
        if (!nonNegative(kinematics.vehicle_following_gap) || !nonNegative(kinematics.cyclist_following_gap))
        {
            errors.push_back("kinematics following gaps must be non-negative");
        }
        if (!nonNegative(kinematics.departure_threshold) || !nonNegative(kinematics.yellow_commit_distance))
        {
            errors.push_back("kinematics departure threshold and yellow commit distance must be non-negative");
        }
        if (!positive(kinematics.pedestrian_arrival_radius))
        {
            errors.push_back("kinematics pedestrian_arrival_radius must be positive");
        }
        if (!positive(kinematics.flashing_speed_factor))
        {
            errors.push_back("kinematics flashing_speed_factor must be positive");
        }
        if (!nonNegative(kinematics.off_scene_margin))
        {
            errors.push_back("kinematics off_scene_margin must be non-negative");
        }
    }

    void SafetyChecker::checkSpawner(const SpawnerConfig &spawner, std::vector<std::string> &errors) const
    {
        checkRange("spawner vehicle", spawner.vehicle_interval_min, spawner.vehicle_interval_max, errors);
        checkRange("spawner cyclist", spawner.cyclist_interval_min, spawner.cyclist_interval_max, errors);
        checkRange("spawner pedestrian", spawner.pedestrian_interval_min, spawner.pedestrian_interval_max, errors);

        if (!nonNegative(spawner.vehicle_spawn_offset) || !nonNegative(spawner.cyclist_spawn_offset) ||
            !nonNegative(spawner.vehicle_spawn_clearance))
        {
            errors.push_back("spawner offsets and clearance must be non-negative");
        }
        if (spawner.wave_min > spawner.wave_max)
        {
            errors.push_back("spawner wave_min must not exceed wave_max");
        }
        if (spawner.burst_min > spawner.burst_max)
        {
            errors.push_back("spawner burst_min must not exceed burst_max");
        }

        const PathWeights &weights = spawner.path_weights;
        if (!nonNegative(weights.sidewalk) || !nonNegative(weights.crossing) || !nonNegative(weights.diagonal) ||
            weights.sidewalk + weights.crossing + weights.diagonal <= 0.0)
        {
            errors.push_back("spawner path weights must be non-negative with a positive sum");
        }
    }

    bool SafetyChecker::isSafe(const IntersectionState &state) const
    {
        return hasConflictingGreens(state) && checkPedestrianSafety(state);
    }

    bool SafetyChecker::hasConflictingGreens(const IntersectionState &state) const
    {
        auto is_active = [](LightState s)
        { return s == LightState::Green || s == LightState::Yellow; };

        return !(is_active(state.north_south) && is_active(state.east_west));
    }

    bool SafetyChecker::checkPedestrianSafety(const IntersectionState &state) const
    {
        // Scramble crossing: pedestrians own every crosswalk, so all vehicle lamps must be red
        if (state.pedestrians == WalkState::DontWalk)
        {
            return true;
        }
        return state.north_south == LightState::Red && state.east_west == LightState::Red;
    }

    bool SafetyChecker::isValidTransition(const IntersectionState &prev, const IntersectionState &next) const
    {
        auto valid_for_light = [](LightState p, LightState n)
        {
            if (p == n)
                return true;
            if (p == LightState::Green && n == LightState::Yellow)
                return true;
            if (p == LightState::Yellow && n == LightState::Red)
                return true;
            if (p == LightState::Red && n == LightState::Green)
                return true;
            return false;
        };

        auto valid_for_walk = [](WalkState p, WalkState n)
        {
            if (p == n)
                return true;
            if (p == WalkState::DontWalk && n == WalkState::Walk)
                return true;
            if (p == WalkState::Walk && n == WalkState::Flashing)
                return true;
            if (p == WalkState::Flashing && n == WalkState::DontWalk)
                return true;
            return false;
        };

        return valid_for_light(prev.north_south, next.north_south) &&
               valid_for_light(prev.east_west, next.east_west) &&
               valid_for_walk(prev.pedestrians, next.pedestrians) &&
               isSafe(next);
    }

    std::size_t SafetyChecker::countFollowingViolations(const EntityStore &store, const KinematicsConfig &kinematics,
                                                        double tolerance) const
    {
        std::size_t violations = 0;
        const std::vector<const Entity *> traffic = trafficEntities(store);

        for (const Entity *follower_ptr : traffic)
        {
            const Entity &follower = *follower_ptr;
            const Entity *leader = findLeader(follower, traffic);
            if (!leader)
            {
                continue;
            }

            const double gap = follower.kind == EntityKind::Cyclist ? kinematics.cyclist_following_gap
                                                                    : kinematics.vehicle_following_gap;
            if (frontEdge(follower) > rearEdge(*leader) - gap + tolerance)
            {
                violations += 1;
            }
        }

        return violations;
    }

} // namespace scramble
