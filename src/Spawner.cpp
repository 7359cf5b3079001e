#include "Spawner.hpp"

#include "Kinematics.hpp"

#include <cmath>
#include <cstddef>
#include <iterator>
#include <utility>

namespace scramble
{
    namespace
    {
        constexpr double kEdgeInset = 10.0; // pedestrians enter and leave just outside the scene
        constexpr double kCornerJitter = 6.0;
        constexpr double kCruiseVariance = 4.0;
        constexpr double kWaitingCrosserOnCrossing = 0.8;

        struct WeightedName
        {
            const char *name;
            double weight;
        };

        const WeightedName kVehicleTypes[] = {
            {"sedan", 50.0},
            {"taxi", 20.0},
            {"bus", 10.0},
            {"kei_truck", 15.0},
            {"police", 5.0},
        };

        const char *kSedanColors[] = {"red", "blue", "white", "black"};

        const WeightedName kPedestrianVariants[] = {
            {"office_m", 40.0},
            {"office_f", 40.0},
            {"student", 25.0},
            {"tourist", 20.0},
            {"elderly", 15.0},
        };

        double vehicleBaseCruise(const std::string &type)
        {
            if (type == "bus")
                return 35.0;
            if (type == "kei_truck")
                return 40.0;
            return 50.0;
        }

        double pedestrianSpeed(const std::string &variant)
        {
            if (variant == "elderly")
                return 18.0;
            if (variant == "tourist")
                return 20.0;
            if (variant == "student")
                return 28.0;
            return 25.0;
        }

        Corner adjacentCorner(Corner corner, bool clockwise)
        {
            int index = static_cast<int>(corner);
            return static_cast<Corner>((index + (clockwise ? 1 : 3)) % 4);
        }

        Corner oppositeCorner(Corner corner)
        {
            return static_cast<Corner>((static_cast<int>(corner) + 2) % 4);
        }

        // Heading of the first segment that actually goes somewhere.
        Heading initialHeading(const std::vector<Waypoint> &path)
        {
            for (std::size_t i = 1; i < path.size(); ++i)
            {
                double dx = path[i].position.x - path[0].position.x;
                double dy = path[i].position.y - path[0].position.y;
                if (dx != 0.0 || dy != 0.0)
                {
                    return quantizeHeading(dx, dy);
                }
            }
            return Heading::South;
        }
    }

    Spawner::Spawner(const SceneLayout &layout,
                     const SpawnerConfig &config,
                     std::shared_ptr<const ITextureCatalog> textures)
        : Spawner(layout, config, std::move(textures), std::mt19937(config.seed))
    {
    }

    Spawner::Spawner(const SceneLayout &layout,
                     const SpawnerConfig &config,
                     std::shared_ptr<const ITextureCatalog> textures,
                     std::mt19937 rng)
        : layout(layout),
          config(config),
          textures(std::move(textures)),
          rng(rng),
          initial_rng(rng)
    {
        drawIntervals();
    }

    void Spawner::reset()
    {
        rng = initial_rng;
        vehicle_timer = 0.0;
        cyclist_timer = 0.0;
        pedestrian_timer = 0.0;
        last_phase.reset();
        group_spawned_this_phase = false;
        stats = SpawnerStats{};
        drawIntervals();
    }

    double Spawner::uniform(double min_value, double max_value)
    {
        if (max_value <= min_value)
        {
            return min_value;
        }
        std::uniform_real_distribution<double> distribution(min_value, max_value);
        return distribution(rng);
    }

    std::size_t Spawner::uniformIndex(std::size_t count)
    {
        if (count <= 1)
        {
            return 0;
        }
        std::uniform_int_distribution<std::size_t> distribution(0, count - 1);
        return distribution(rng);
    }

    std::size_t Spawner::uniformCount(std::size_t min_value, std::size_t max_value)
    {
        if (max_value <= min_value)
        {
            return min_value;
        }
        std::uniform_int_distribution<std::size_t> distribution(min_value, max_value);
        return distribution(rng);
    }

    double Spawner::jitter(double amount)
    {
        return uniform(-amount / 2.0, amount / 2.0);
    }

    void Spawner::drawIntervals()
    {
        next_vehicle_interval = uniform(config.vehicle_interval_min, config.vehicle_interval_max);
        next_cyclist_interval = uniform(config.cyclist_interval_min, config.cyclist_interval_max);
        next_pedestrian_interval = uniform(config.pedestrian_interval_min, config.pedestrian_interval_max);
    }

    void Spawner::update(double dt_seconds, const SignalController &signal, EntityStore &store)
    {
        vehicle_timer += dt_seconds;
        if (vehicle_timer >= next_vehicle_interval)
        {
            vehicle_timer = 0.0;
            next_vehicle_interval = uniform(config.vehicle_interval_min, config.vehicle_interval_max);
            spawnVehicle(store);
        }

        cyclist_timer += dt_seconds;
        if (cyclist_timer >= next_cyclist_interval)
        {
            cyclist_timer = 0.0;
            next_cyclist_interval = uniform(config.cyclist_interval_min, config.cyclist_interval_max);
            spawnCyclist(store);
        }

        if (config.pedestrian_mode == PedestrianSpawnMode::Continuous)
        {
            pedestrian_timer += dt_seconds;
            if (pedestrian_timer >= next_pedestrian_interval)
            {
                pedestrian_timer = 0.0;
                next_pedestrian_interval = uniform(config.pedestrian_interval_min, config.pedestrian_interval_max);
                spawnPedestrian(store);
            }
        }

        // One wave or burst per phase occurrence, however many ticks the phase lasts
        const TrafficPhase phase = signal.phase();
        if (!last_phase || *last_phase != phase)
        {
            last_phase = phase;
            group_spawned_this_phase = false;
        }

        if (group_spawned_this_phase)
        {
            return;
        }

        if (config.burst_enabled && phase == TrafficPhase::ALL_RED_2)
        {
            group_spawned_this_phase = true;
            spawnBurst(store);
        }
        else if (config.pedestrian_mode == PedestrianSpawnMode::Wave && phase == TrafficPhase::SCRAMBLE)
        {
            group_spawned_this_phase = true;
            spawnWave(store);
        }
    }

    Vec2 Spawner::spawnPoint(Heading heading, int lane, double offset) const
    {
        switch (heading)
        {
        case Heading::South:
            return {layout.nsLaneX(lane), -offset};
        case Heading::North:
            return {layout.nsLaneX(lane), layout.scene_height + offset};
        case Heading::East:
            return {-offset, layout.ewLaneY(lane)};
        case Heading::West:
            return {layout.scene_width + offset, layout.ewLaneY(lane)};
        default:
            break;
        }
        return {-offset, -offset};
    }

    bool Spawner::hasClearance(const EntityStore &store, Heading heading, Vec2 point) const
    {
        for (const auto &entry : store)
        {
            const Entity &other = entry.second;
            if (!other.isTraffic() || other.heading != heading)
            {
                continue;
            }
            double distance = std::abs(other.position.x - point.x) + std::abs(other.position.y - point.y);
            if (distance < config.vehicle_spawn_clearance)
            {
                return false;
            }
        }
        return true;
    }

    std::optional<EntityId> Spawner::spawnTraffic(EntityStore &store, EntityKind kind, Heading heading, int lane,
                                                  const std::string &variant, const std::string &texture_key,
                                                  double cruise_speed, double offset)
    {
        const Vec2 position = spawnPoint(heading, lane, offset);
        if (!hasClearance(store, heading, position))
        {
            stats.rejected_for_clearance += 1;
            return std::nullopt;
        }

        std::optional<TextureInfo> texture = textures ? textures->find(texture_key) : std::nullopt;
        if (!texture)
        {
            stats.skipped_missing_texture += 1;
            return std::nullopt;
        }

        const double length = axisOf(heading) == Axis::NorthSouth ? texture->height : texture->width;
        Entity entity = makeTrafficEntity(kind, heading, lane, position, cruise_speed, length);
        entity.variant = variant;
        entity.texture_key = texture_key;
        return store.insert(std::move(entity));
    }

    std::optional<EntityId> Spawner::spawnVehicle(EntityStore &store)
    {
        const Heading heading = kCardinalHeadings[uniformIndex(kCardinalHeadings.size())];

        double total = 0.0;
        for (const auto &type : kVehicleTypes)
        {
            total += type.weight;
        }
        double pick = uniform(0.0, total);
        std::string type = kVehicleTypes[std::size(kVehicleTypes) - 1].name;
        for (const auto &candidate : kVehicleTypes)
        {
            pick -= candidate.weight;
            if (pick <= 0.0)
            {
                type = candidate.name;
                break;
            }
        }

        const std::array<int, 2> lanes = vehicleLanesFor(layout, heading);
        const int lane = lanes[uniformIndex(lanes.size())];

        std::string texture_key;
        if (type == "sedan")
        {
            texture_key = sedanTextureKey(kSedanColors[uniformIndex(std::size(kSedanColors))], heading);
        }
        else
        {
            texture_key = vehicleTextureKey(type, heading);
        }

        const double cruise = vehicleBaseCruise(type) + jitter(kCruiseVariance);
        auto id = spawnTraffic(store, EntityKind::Vehicle, heading, lane, type, texture_key, cruise,
                               config.vehicle_spawn_offset);
        if (id)
        {
            stats.vehicles_spawned += 1;
        }
        return id;
    }

    std::optional<EntityId> Spawner::spawnCyclist(EntityStore &store)
    {
        const Heading heading = kCardinalHeadings[uniformIndex(kCardinalHeadings.size())];
        const std::string variant = uniform(0.0, 1.0) < 0.7 ? "commuter" : "delivery";
        const int lane = curbLaneFor(layout, heading);
        const double cruise = 30.0 + jitter(kCruiseVariance);

        auto id = spawnTraffic(store, EntityKind::Cyclist, heading, lane, variant,
                               cyclistTextureKey(variant, heading, 0), cruise, config.cyclist_spawn_offset);
        if (id)
        {
            stats.cyclists_spawned += 1;
        }
        return id;
    }

    std::optional<EntityId> Spawner::spawnPedestrian(EntityStore &store)
    {
        return spawnPedestrianOnPath(store, randomPedestrianPath());
    }

    std::optional<EntityId> Spawner::spawnPedestrianOnPath(EntityStore &store, std::vector<Waypoint> path)
    {
        if (store.countByKind(EntityKind::Pedestrian) >= config.max_pedestrians || path.size() < 2)
        {
            return std::nullopt;
        }

        double total = 0.0;
        for (const auto &variant : kPedestrianVariants)
        {
            total += variant.weight;
        }
        double pick = uniform(0.0, total);
        std::string variant = kPedestrianVariants[std::size(kPedestrianVariants) - 1].name;
        for (const auto &candidate : kPedestrianVariants)
        {
            pick -= candidate.weight;
            if (pick <= 0.0)
            {
                variant = candidate.name;
                break;
            }
        }

        const Heading heading = initialHeading(path);
        const std::string texture_key = pedestrianTextureKey(variant, heading, 0);
        if (!textures || !textures->find(texture_key))
        {
            stats.skipped_missing_texture += 1;
            return std::nullopt;
        }

        Entity entity = makePedestrianEntity(std::move(path), pedestrianSpeed(variant));
        entity.heading = heading;
        entity.variant = variant;
        entity.texture_key = texture_key;
        stats.pedestrians_spawned += 1;
        return store.insert(std::move(entity));
    }

    std::size_t Spawner::spawnBurst(EntityStore &store)
    {
        stats.bursts += 1;
        const std::size_t count = uniformCount(config.burst_min, config.burst_max);
        std::size_t spawned = 0;
        for (std::size_t i = 0; i < count; ++i)
        {
            if (spawnPedestrianOnPath(store, waitingCrosserPath()))
            {
                spawned += 1;
            }
        }
        return spawned;
    }

    std::size_t Spawner::spawnWave(EntityStore &store)
    {
        stats.waves += 1;
        const std::size_t count = uniformCount(config.wave_min, config.wave_max);
        std::size_t spawned = 0;
        for (std::size_t i = 0; i < count; ++i)
        {
            if (spawnPedestrianOnPath(store, waitingCrosserPath()))
            {
                spawned += 1;
            }
        }
        return spawned;
    }

    Vec2 Spawner::exitPoint(Corner corner)
    {
        const Vec2 point = layout.cornerPoint(corner);
        const double west = -kEdgeInset;
        const double east = layout.scene_width + kEdgeInset;
        const double north = -kEdgeInset;
        const double south = layout.scene_height + kEdgeInset;
        const bool along_ew_road = uniform(0.0, 1.0) < 0.5;

        switch (corner)
        {
        case Corner::NorthWest:
            return along_ew_road ? Vec2{west, point.y} : Vec2{point.x, north};
        case Corner::NorthEast:
            return along_ew_road ? Vec2{east, point.y} : Vec2{point.x, north};
        case Corner::SouthEast:
            return along_ew_road ? Vec2{east, point.y} : Vec2{point.x, south};
        case Corner::SouthWest:
            return along_ew_road ? Vec2{west, point.y} : Vec2{point.x, south};
        }
        return {west, point.y};
    }

    Vec2 Spawner::jitteredCorner(Corner corner)
    {
        Vec2 point = layout.cornerPoint(corner);
        point.x += jitter(kCornerJitter);
        point.y += jitter(kCornerJitter);
        return point;
    }

    std::vector<Waypoint> Spawner::sidewalkPath()
    {
        // Round one corner of a block without crossing a road
        const Corner corner = static_cast<Corner>(uniformIndex(4));
        const Vec2 point = layout.cornerPoint(corner);
        const double edge_x = (corner == Corner::NorthWest || corner == Corner::SouthWest)
                                  ? -kEdgeInset
                                  : layout.scene_width + kEdgeInset;
        const double edge_y = (corner == Corner::NorthWest || corner == Corner::NorthEast)
                                  ? -kEdgeInset
                                  : layout.scene_height + kEdgeInset;

        Vec2 along_ew{edge_x, point.y};
        Vec2 along_ns{point.x, edge_y};
        if (uniform(0.0, 1.0) < 0.5)
        {
            std::swap(along_ew, along_ns);
        }

        return {
            {along_ew, false},
            {jitteredCorner(corner), false},
            {along_ns, false},
        };
    }

    std::vector<Waypoint> Spawner::crossingPath()
    {
        const Corner from = static_cast<Corner>(uniformIndex(4));
        const Corner to = adjacentCorner(from, uniform(0.0, 1.0) < 0.5);
        return {
            {exitPoint(from), false},
            {jitteredCorner(from), true},
            {jitteredCorner(to), false},
            {exitPoint(to), false},
        };
    }

    std::vector<Waypoint> Spawner::diagonalPath()
    {
        const Corner from = static_cast<Corner>(uniformIndex(4));
        const Corner to = oppositeCorner(from);
        return {
            {exitPoint(from), false},
            {jitteredCorner(from), true},
            {jitteredCorner(to), false},
            {exitPoint(to), false},
        };
    }

    std::vector<Waypoint> Spawner::randomPedestrianPath()
    {
        const PathWeights &weights = config.path_weights;
        const double total = weights.sidewalk + weights.crossing + weights.diagonal;
        if (total <= 0.0)
        {
            return crossingPath();
        }

        const double pick = uniform(0.0, total);
        if (pick < weights.sidewalk)
        {
            return sidewalkPath();
        }
        if (pick < weights.sidewalk + weights.crossing)
        {
            return crossingPath();
        }
        return diagonalPath();
    }

    std::vector<Waypoint> Spawner::waitingCrosserPath()
    {
        std::vector<Waypoint> full = uniform(0.0, 1.0) < kWaitingCrosserOnCrossing ? crossingPath() : diagonalPath();

        std::size_t wait_index = 0;
        while (wait_index < full.size() && !full[wait_index].wait_for_signal)
        {
            ++wait_index;
        }
        if (wait_index >= full.size())
        {
            return full;
        }

        // Stand on the wait point; the first target is that same flagged point, so the
        // pedestrian holds there until the walk phase.
        std::vector<Waypoint> path;
        path.push_back({full[wait_index].position, false});
        path.insert(path.end(), full.begin() + static_cast<std::ptrdiff_t>(wait_index), full.end());
        return path;
    }

} // namespace scramble
