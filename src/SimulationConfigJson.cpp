#include "SimulationConfigJson.hpp"

#include "SafetyChecker.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace scramble
{
    namespace
    {
        using nlohmann::json;

        bool pedestrianModeFromString(const std::string &value, PedestrianSpawnMode &mode)
        {
            if (value == "continuous")
            {
                mode = PedestrianSpawnMode::Continuous;
                return true;
            }
            if (value == "wave")
            {
                mode = PedestrianSpawnMode::Wave;
                return true;
            }
            return false;
        }

        // Field readers leave `out` untouched when the key is absent.
        void readNumber(const json &section, const char *key, const std::string &prefix,
                        double &out, std::vector<std::string> &errors)
        {
            if (!section.contains(key))
            {
                return;
            }
            if (!section[key].is_number())
            {
                errors.push_back(prefix + "." + key + " must be a number");
                return;
            }
            out = section[key].get<double>();
        }

        void readBool(const json &section, const char *key, const std::string &prefix,
                      bool &out, std::vector<std::string> &errors)
        {
            if (!section.contains(key))
            {
                return;
            }
            if (!section[key].is_boolean())
            {
                errors.push_back(prefix + "." + key + " must be a boolean");
                return;
            }
            out = section[key].get<bool>();
        }

        template <typename T>
        void readUnsigned(const json &section, const char *key, const std::string &prefix,
                          T &out, std::vector<std::string> &errors)
        {
            if (!section.contains(key))
            {
                return;
            }
            if (!section[key].is_number_unsigned())
            {
                errors.push_back(prefix + "." + key + " must be an unsigned integer");
                return;
            }
            const uint64_t value = section[key].get<uint64_t>();
            if (value > static_cast<uint64_t>(std::numeric_limits<T>::max()))
            {
                errors.push_back(prefix + "." + key + " must be at most " + std::to_string(std::numeric_limits<T>::max()));
                return;
            }
            out = static_cast<T>(value);
        }

        void readInt(const json &section, const char *key, const std::string &prefix,
                     int &out, std::vector<std::string> &errors)
        {
            if (!section.contains(key))
            {
                return;
            }
            if (!section[key].is_number_integer())
            {
                errors.push_back(prefix + "." + key + " must be an integer");
                return;
            }
            const json &value = section[key];
            const bool too_large = value.is_number_unsigned()
                                       ? value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())
                                       : value.get<int64_t>() > std::numeric_limits<int>::max();
            const bool too_small = !value.is_number_unsigned() && value.get<int64_t>() < std::numeric_limits<int>::min();
            if (too_large || too_small)
            {
                errors.push_back(prefix + "." + key + " is out of range");
                return;
            }
            out = static_cast<int>(value.get<int64_t>());
        }

        // Returns the section when present and an object; reports it otherwise.
        const json *section(const json &root, const char *key, std::vector<std::string> &errors)
        {
            if (!root.contains(key))
            {
                return nullptr;
            }
            if (!root[key].is_object())
            {
                errors.push_back(std::string(key) + " must be an object");
                return nullptr;
            }
            return &root[key];
        }

        void parseLayout(const json &node, SceneLayout &layout, std::vector<std::string> &errors)
        {
            const std::string prefix = "layout";
            readNumber(node, "scene_width", prefix, layout.scene_width, errors);
            readNumber(node, "scene_height", prefix, layout.scene_height, errors);
            readNumber(node, "lane_width", prefix, layout.lane_width, errors);
            readInt(node, "lanes_per_road", prefix, layout.lanes_per_road, errors);
            readNumber(node, "zebra_width", prefix, layout.zebra_width, errors);
            readNumber(node, "stop_line_setback", prefix, layout.stop_line_setback, errors);
        }

        void parseSignal(const json &node, SignalTimingConfig &signal, std::vector<std::string> &errors)
        {
            const std::string prefix = "signal";
            readNumber(node, "ns_green", prefix, signal.ns_green, errors);
            readNumber(node, "ns_yellow", prefix, signal.ns_yellow, errors);
            readNumber(node, "all_red_1", prefix, signal.all_red_1, errors);
            readNumber(node, "ew_green", prefix, signal.ew_green, errors);
            readNumber(node, "ew_yellow", prefix, signal.ew_yellow, errors);
            readNumber(node, "all_red_2", prefix, signal.all_red_2, errors);
            readNumber(node, "scramble", prefix, signal.scramble, errors);
            readNumber(node, "scramble_flash", prefix, signal.scramble_flash, errors);
            readNumber(node, "all_red_3", prefix, signal.all_red_3, errors);
        }

        void parseKinematics(const json &node, KinematicsConfig &kinematics, std::vector<std::string> &errors)
        {
            const std::string prefix = "kinematics";
            readNumber(node, "deceleration", prefix, kinematics.deceleration, errors);
            readNumber(node, "acceleration", prefix, kinematics.acceleration, errors);
            readNumber(node, "vehicle_following_gap", prefix, kinematics.vehicle_following_gap, errors);
            readNumber(node, "cyclist_following_gap", prefix, kinematics.cyclist_following_gap, errors);
            readNumber(node, "departure_threshold", prefix, kinematics.departure_threshold, errors);
            readNumber(node, "yellow_commit_distance", prefix, kinematics.yellow_commit_distance, errors);
            readNumber(node, "pedestrian_arrival_radius", prefix, kinematics.pedestrian_arrival_radius, errors);
            readNumber(node, "flashing_speed_factor", prefix, kinematics.flashing_speed_factor, errors);
            readNumber(node, "off_scene_margin", prefix, kinematics.off_scene_margin, errors);
            readBool(node, "double_buffered", prefix, kinematics.double_buffered, errors);
        }

        void parseSpawner(const json &node, SpawnerConfig &spawner, std::vector<std::string> &errors)
        {
            const std::string prefix = "spawner";
            readUnsigned(node, "seed", prefix, spawner.seed, errors);
            readNumber(node, "vehicle_interval_min", prefix, spawner.vehicle_interval_min, errors);
            readNumber(node, "vehicle_interval_max", prefix, spawner.vehicle_interval_max, errors);
            readNumber(node, "vehicle_spawn_offset", prefix, spawner.vehicle_spawn_offset, errors);
            readNumber(node, "vehicle_spawn_clearance", prefix, spawner.vehicle_spawn_clearance, errors);
            readNumber(node, "cyclist_interval_min", prefix, spawner.cyclist_interval_min, errors);
            readNumber(node, "cyclist_interval_max", prefix, spawner.cyclist_interval_max, errors);
            readNumber(node, "cyclist_spawn_offset", prefix, spawner.cyclist_spawn_offset, errors);
            readNumber(node, "pedestrian_interval_min", prefix, spawner.pedestrian_interval_min, errors);
            readNumber(node, "pedestrian_interval_max", prefix, spawner.pedestrian_interval_max, errors);
            readUnsigned(node, "max_pedestrians", prefix, spawner.max_pedestrians, errors);
            readUnsigned(node, "wave_min", prefix, spawner.wave_min, errors);
            readUnsigned(node, "wave_max", prefix, spawner.wave_max, errors);
            readBool(node, "burst_enabled", prefix, spawner.burst_enabled, errors);
            readUnsigned(node, "burst_min", prefix, spawner.burst_min, errors);
            readUnsigned(node, "burst_max", prefix, spawner.burst_max, errors);

            if (node.contains("pedestrian_mode"))
            {
                if (!node["pedestrian_mode"].is_string())
                {
                    errors.push_back("spawner.pedestrian_mode must be a string");
                }
                else
                {
                    const std::string value = node["pedestrian_mode"].get<std::string>();
                    if (!pedestrianModeFromString(value, spawner.pedestrian_mode))
                    {
                        errors.push_back("spawner.pedestrian_mode unknown value: " + value);
                    }
                }
            }

            if (const json *weights = section(node, "path_weights", errors))
            {
                const std::string weights_prefix = "spawner.path_weights";
                readNumber(*weights, "sidewalk", weights_prefix, spawner.path_weights.sidewalk, errors);
                readNumber(*weights, "crossing", weights_prefix, spawner.path_weights.crossing, errors);
                readNumber(*weights, "diagonal", weights_prefix, spawner.path_weights.diagonal, errors);
            }
        }
    }

    std::string simulationConfigToJson(const SimulationConfig &config)
    {
        json root;

        const SceneLayout &layout = config.layout;
        root["layout"] = {
            {"scene_width", layout.scene_width},
            {"scene_height", layout.scene_height},
            {"lane_width", layout.lane_width},
            {"lanes_per_road", layout.lanes_per_road},
            {"zebra_width", layout.zebra_width},
            {"stop_line_setback", layout.stop_line_setback},
        };

        const SignalTimingConfig &signal = config.signal;
        root["signal"] = {
            {"ns_green", signal.ns_green},
            {"ns_yellow", signal.ns_yellow},
            {"all_red_1", signal.all_red_1},
            {"ew_green", signal.ew_green},
            {"ew_yellow", signal.ew_yellow},
            {"all_red_2", signal.all_red_2},
            {"scramble", signal.scramble},
            {"scramble_flash", signal.scramble_flash},
            {"all_red_3", signal.all_red_3},
        };

        const KinematicsConfig &kinematics = config.kinematics;
        root["kinematics"] = {
            {"deceleration", kinematics.deceleration},
            {"acceleration", kinematics.acceleration},
            {"vehicle_following_gap", kinematics.vehicle_following_gap},
            {"cyclist_following_gap", kinematics.cyclist_following_gap},
            {"departure_threshold", kinematics.departure_threshold},
            {"yellow_commit_distance", kinematics.yellow_commit_distance},
            {"pedestrian_arrival_radius", kinematics.pedestrian_arrival_radius},
            {"flashing_speed_factor", kinematics.flashing_speed_factor},
            {"off_scene_margin", kinematics.off_scene_margin},
            {"double_buffered", kinematics.double_buffered},
        };

        const SpawnerConfig &spawner = config.spawner;
        json spawner_json;
        spawner_json["seed"] = spawner.seed;
        spawner_json["vehicle_interval_min"] = spawner.vehicle_interval_min;
        spawner_json["vehicle_interval_max"] = spawner.vehicle_interval_max;
        spawner_json["vehicle_spawn_offset"] = spawner.vehicle_spawn_offset;
        spawner_json["vehicle_spawn_clearance"] = spawner.vehicle_spawn_clearance;
        spawner_json["cyclist_interval_min"] = spawner.cyclist_interval_min;
        spawner_json["cyclist_interval_max"] = spawner.cyclist_interval_max;
        spawner_json["cyclist_spawn_offset"] = spawner.cyclist_spawn_offset;
        spawner_json["pedestrian_mode"] = toString(spawner.pedestrian_mode);
        spawner_json["pedestrian_interval_min"] = spawner.pedestrian_interval_min;
        spawner_json["pedestrian_interval_max"] = spawner.pedestrian_interval_max;
        spawner_json["max_pedestrians"] = spawner.max_pedestrians;
        spawner_json["path_weights"] = {
            {"sidewalk", spawner.path_weights.sidewalk},
            {"crossing", spawner.path_weights.crossing},
            {"diagonal", spawner.path_weights.diagonal},
        };
        spawner_json["wave_min"] = spawner.wave_min;
        spawner_json["wave_max"] = spawner.wave_max;
        spawner_json["burst_enabled"] = spawner.burst_enabled;
        spawner_json["burst_min"] = spawner.burst_min;
        spawner_json["burst_max"] = spawner.burst_max;
        root["spawner"] = spawner_json;

        root["tick_rate_hz"] = config.tick_rate_hz;
        root["start_time_of_day"] = config.start_time_of_day;

        return root.dump();
    }

    ConfigParseResult simulationConfigFromJson(const std::string &json_text)
    {
        ConfigParseResult result;
        result.config = makeDefaultSimulationConfig();

        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const std::exception &e)
        {
            result.errors.push_back(std::string("invalid JSON: ") + e.what());
            return result;
        }

        if (!root.is_object())
        {
            result.errors.push_back("root must be an object");
            return result;
        }

        if (const json *node = section(root, "layout", result.errors))
        {
            parseLayout(*node, result.config.layout, result.errors);
        }
        if (const json *node = section(root, "signal", result.errors))
        {
            parseSignal(*node, result.config.signal, result.errors);
        }
        if (const json *node = section(root, "kinematics", result.errors))
        {
            parseKinematics(*node, result.config.kinematics, result.errors);
        }
        if (const json *node = section(root, "spawner", result.errors))
        {
            parseSpawner(*node, result.config.spawner, result.errors);
        }

        readNumber(root, "tick_rate_hz", "config", result.config.tick_rate_hz, result.errors);
        readNumber(root, "start_time_of_day", "config", result.config.start_time_of_day, result.errors);

        if (result.errors.empty())
        {
            SafetyChecker checker;
            checker.isConfigValid(result.config, &result.errors);
        }

        result.ok = result.errors.empty();
        return result;
    }

    std::string validationErrorsToJson(const std::vector<std::string> &errors)
    {
        nlohmann::json root;
        root["ok"] = false;
        root["errors"] = errors;
        return root.dump();
    }
} // namespace scramble
