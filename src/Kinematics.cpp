#include "Kinematics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace scramble
{
    namespace
    {
        constexpr double kDiagonal = 0.70710678118654752;
        constexpr double kQuarterTurn = 0.78539816339744831;
        constexpr double kAtTargetEpsilon = 1e-6;
        constexpr double kWalkFrameSeconds = 0.15;
        constexpr int kWalkFrames = 4;
        constexpr double kPedalFrameSeconds = 0.3;

        void advanceAnimation(Entity &entity, double dt_seconds, double frame_seconds, int frame_count)
        {
            entity.anim_timer += dt_seconds;
            if (entity.anim_timer > frame_seconds)
            {
                entity.anim_timer = 0.0;
                entity.anim_frame = (entity.anim_frame + 1) % frame_count;
            }
        }
    }

    Vec2 unitVector(Heading heading)
    {
        switch (heading)
        {
        case Heading::North:
            return {0.0, -1.0};
        case Heading::NorthEast:
            return {kDiagonal, -kDiagonal};
        case Heading::East:
            return {1.0, 0.0};
        case Heading::SouthEast:
            return {kDiagonal, kDiagonal};
        case Heading::South:
            return {0.0, 1.0};
        case Heading::SouthWest:
            return {-kDiagonal, kDiagonal};
        case Heading::West:
            return {-1.0, 0.0};
        case Heading::NorthWest:
            return {-kDiagonal, -kDiagonal};
        }
        return {0.0, 0.0};
    }

    double progressAlong(Heading heading, Vec2 position)
    {
        switch (heading)
        {
        case Heading::South:
            return position.y;
        case Heading::North:
            return -position.y;
        case Heading::East:
            return position.x;
        case Heading::West:
            return -position.x;
        default:
            break;
        }
        Vec2 unit = unitVector(heading);
        return position.x * unit.x + position.y * unit.y;
    }

    double frontEdge(const Entity &entity)
    {
        const VehicleData *data = entity.vehicleData();
        double half_length = data ? data->length / 2.0 : 0.0;
        return progressAlong(entity.heading, entity.position) + half_length;
    }

    double rearEdge(const Entity &entity)
    {
        const VehicleData *data = entity.vehicleData();
        double half_length = data ? data->length / 2.0 : 0.0;
        return progressAlong(entity.heading, entity.position) - half_length;
    }

    double stopLineProgress(const SceneLayout &layout, Heading heading)
    {
        double line = layout.stopLine(heading);
        return (heading == Heading::North || heading == Heading::West) ? -line : line;
    }

    double signedDistanceToTarget(const Entity &entity, double target_progress)
    {
        return target_progress - frontEdge(entity);
    }

    bool isOffScene(const SceneLayout &layout, Vec2 position, double margin)
    {
        return position.x < -margin || position.x > layout.scene_width + margin ||
               position.y < -margin || position.y > layout.scene_height + margin;
    }

    Heading quantizeHeading(double dx, double dy)
    {
        // Octants counted clockwise from east because screen y points south.
        static constexpr Heading kOctants[8] = {Heading::East, Heading::SouthEast, Heading::South, Heading::SouthWest,
                                                Heading::West, Heading::NorthWest, Heading::North, Heading::NorthEast};
        const double octant_angle = std::atan2(dy, dx) / kQuarterTurn;
        long octant = std::lround(octant_angle);
        octant = ((octant % 8) + 8) % 8;
        return kOctants[octant];
    }

    std::vector<const Entity *> trafficEntities(const EntityStore &store)
    {
        std::vector<const Entity *> traffic;
        for (const auto &entry : store)
        {
            if (entry.second.isTraffic())
            {
                traffic.push_back(&entry.second);
            }
        }
        return traffic;
    }

    const Entity *findLeader(const Entity &entity, const std::vector<const Entity *> &candidates)
    {
        const VehicleData *own = entity.vehicleData();
        if (!own)
        {
            return nullptr;
        }

        const double own_progress = progressAlong(entity.heading, entity.position);
        const Entity *leader = nullptr;
        double leader_progress = 0.0;

        for (const Entity *other : candidates)
        {
            if (!other || other->id == entity.id || !other->isTraffic() || other->heading != entity.heading)
            {
                continue;
            }

            const VehicleData *other_data = other->vehicleData();
            if (!other_data || other_data->lane != own->lane)
            {
                continue;
            }

            double progress = progressAlong(other->heading, other->position);
            if (progress <= own_progress)
            {
                continue;
            }

            if (!leader || progress < leader_progress)
            {
                leader = other;
                leader_progress = progress;
            }
        }

        return leader;
    }

    KinematicsEngine::KinematicsEngine(const SceneLayout &layout, const KinematicsConfig &config)
        : layout(layout), config(config)
    {
    }

    double KinematicsEngine::brakingDistance(double speed) const
    {
        if (config.deceleration <= 0.0)
        {
            return 0.0;
        }
        return speed * speed / (2.0 * config.deceleration);
    }

    double KinematicsEngine::approachSpeedLimit(double distance, double dt_seconds) const
    {
        const double step = config.deceleration * dt_seconds;
        if (step <= 0.0)
        {
            return std::numeric_limits<double>::infinity();
        }
        if (distance <= 0.0)
        {
            return 0.0;
        }

        // Speeds v, v - step, v - step*2, ... down to the last positive one cover
        // dt * sum(speeds). Find the j-term profile that ends exactly at `distance`.
        const double steps_covered = distance / (step * dt_seconds);
        long terms = static_cast<long>(std::ceil((std::sqrt(1.0 + 8.0 * steps_covered) - 1.0) / 2.0));
        terms = std::max(terms, 1L);
        while (terms > 1 && static_cast<double>(terms - 1) * terms / 2.0 >= steps_covered)
        {
            terms--;
        }
        while (static_cast<double>(terms) * (terms + 1) / 2.0 < steps_covered)
        {
            terms++;
        }

        const double full_steps = static_cast<double>(terms - 1) * terms / 2.0;
        const double remainder = (distance / dt_seconds - step * full_steps) / static_cast<double>(terms);
        return step * static_cast<double>(terms - 1) + remainder;
    }

    double KinematicsEngine::followingGap(EntityKind kind) const
    {
        return kind == EntityKind::Cyclist ? config.cyclist_following_gap : config.vehicle_following_gap;
    }

    void KinematicsEngine::step(EntityStore &store, const SignalController &signal, double dt_seconds) const
    {
        // Live mode reads neighbours straight from the store, so an entity may see a mix of
        // updated and not-yet-updated leaders. Double-buffered mode reads a tick-start copy.
        std::vector<Entity> snapshot;
        Neighbours neighbours;

        if (config.double_buffered)
        {
            for (const auto &entry : store)
            {
                if (entry.second.isTraffic())
                {
                    snapshot.push_back(entry.second);
                }
            }
            neighbours.reserve(snapshot.size());
            for (const Entity &copy : snapshot)
            {
                neighbours.push_back(&copy);
            }
        }
        else
        {
            neighbours = trafficEntities(store);
        }

        for (auto &entry : store)
        {
            Entity &entity = entry.second;
            switch (entity.kind)
            {
            case EntityKind::Vehicle:
            case EntityKind::Cyclist:
                updateTraffic(entity, neighbours, signal, dt_seconds);
                break;
            case EntityKind::Pedestrian:
                updatePedestrian(entity, signal, dt_seconds);
                break;
            }
        }
    }

    bool KinematicsEngine::isBlockedByLight(const Entity &entity, const SignalController &signal) const
    {
        const VehicleData *data = entity.vehicleData();
        if (!data || data->passed_stop_line)
        {
            return false;
        }

        const double to_line = signedDistanceToTarget(entity, stopLineProgress(layout, entity.heading));
        if (to_line < -kAtTargetEpsilon)
        {
            return false;
        }

        if (signal.canGo(entity.heading))
        {
            return false;
        }

        // Close enough when the light shows yellow: continue through instead of braking hard
        if (signal.shouldSlow(entity.heading) && to_line <= config.yellow_commit_distance)
        {
            return false;
        }

        return true;
    }

    std::optional<double> KinematicsEngine::targetFrontProgress(const Entity &entity, const Neighbours &neighbours,
                                                                const SignalController &signal) const
    {
        std::optional<double> target;

        if (isBlockedByLight(entity, signal))
        {
            target = stopLineProgress(layout, entity.heading);
        }

        if (const Entity *leader = findLeader(entity, neighbours))
        {
            double behind_leader = rearEdge(*leader) - followingGap(entity.kind);
            target = target ? std::min(*target, behind_leader) : behind_leader;
        }

        return target;
    }

    void KinematicsEngine::updateTraffic(Entity &entity, const Neighbours &neighbours,
                                         const SignalController &signal, double dt_seconds) const
    {
        VehicleData *data = entity.vehicleData();
        if (!data || !isCardinal(entity.heading))
        {
            entity.activity = ActivityState::Despawning;
            return;
        }

        const double front = frontEdge(entity);
        // A vehicle parked on the line is still held by it
        if (front > stopLineProgress(layout, entity.heading) + kAtTargetEpsilon)
        {
            data->passed_stop_line = true;
        }

        const std::optional<double> target = targetFrontProgress(entity, neighbours, signal);
        const double distance = target ? std::max(0.0, *target - front) : 0.0;
        const bool at_or_past_target = target && *target - front <= kAtTargetEpsilon;
        // Fastest speed this tick from which the vehicle can still stop on the target
        const double limit = target ? approachSpeedLimit(distance, dt_seconds)
                                    : std::numeric_limits<double>::infinity();

        SpeedState next;
        if (at_or_past_target && entity.speed <= 0.0)
        {
            next = SpeedState::Stopped;
        }
        else if (entity.speed_state == SpeedState::Stopped && target && distance <= config.departure_threshold)
        {
            // Departure hysteresis: stay put until a usable gap has opened
            next = SpeedState::Stopped;
        }
        else if (target && entity.speed > 0.0 && entity.speed >= limit)
        {
            // On the braking curve, speed stays one step above the next tick's limit, so braking
            // holds until the vehicle is stopped or the target moves away.
            next = SpeedState::Decelerating;
        }
        else if (entity.speed < entity.cruise_speed || entity.cruise_speed > limit)
        {
            next = SpeedState::Accelerating;
        }
        else
        {
            next = SpeedState::Cruising;
        }

        switch (next)
        {
        case SpeedState::Cruising:
            entity.speed = entity.cruise_speed;
            break;
        case SpeedState::Accelerating:
            entity.speed = std::min({entity.cruise_speed, entity.speed + config.acceleration * dt_seconds, limit});
            break;
        case SpeedState::Decelerating:
            entity.speed = std::max({0.0, entity.speed - config.deceleration * dt_seconds, std::min(entity.speed, limit)});
            if (at_or_past_target)
            {
                entity.speed = 0.0;
            }
            break;
        case SpeedState::Stopped:
            entity.speed = 0.0;
            break;
        }
        entity.speed_state = next;

        // The only place a vehicle's position changes.
        double travel = entity.speed * dt_seconds;
        if (target && front + travel > *target)
        {
            // Rounding at the end of the braking curve only trims the step; a real overshoot
            // (target appeared too close to brake for) stops the vehicle on the spot.
            const bool overshoot = front + travel > *target + kAtTargetEpsilon;
            travel = std::max(0.0, *target - front);
            if (overshoot)
            {
                entity.speed = 0.0;
                entity.speed_state = SpeedState::Stopped;
            }
        }

        Vec2 unit = unitVector(entity.heading);
        entity.position.x += unit.x * travel;
        entity.position.y += unit.y * travel;

        if (isOffScene(layout, entity.position, config.off_scene_margin))
        {
            entity.activity = ActivityState::Despawning;
        }
        else if (entity.speed > 0.0)
        {
            entity.activity = ActivityState::Moving;
        }
        else
        {
            entity.activity = ActivityState::Waiting;
        }

        if (entity.kind == EntityKind::Cyclist && entity.speed > 0.0)
        {
            advanceAnimation(entity, dt_seconds, kPedalFrameSeconds, 2);
        }
    }

    void KinematicsEngine::updatePedestrian(Entity &entity, const SignalController &signal, double dt_seconds) const
    {
        PedestrianData *data = entity.pedestrianData();
        if (!data || data->path.size() < 2 || data->cursor >= data->path.size())
        {
            entity.activity = ActivityState::Despawning;
            return;
        }

        const Waypoint &target = data->path[data->cursor];
        if (!std::isfinite(target.position.x) || !std::isfinite(target.position.y))
        {
            entity.activity = ActivityState::Despawning;
            return;
        }

        double speed = entity.cruise_speed;
        if (signal.pedestriansFlashing())
        {
            speed *= config.flashing_speed_factor;
        }

        double dx = target.position.x - entity.position.x;
        double dy = target.position.y - entity.position.y;
        double distance = std::sqrt(dx * dx + dy * dy);

        if (distance >= config.pedestrian_arrival_radius)
        {
            entity.heading = quantizeHeading(dx, dy);
            double travel = std::min(speed * dt_seconds, distance);
            entity.position.x += dx / distance * travel;
            entity.position.y += dy / distance * travel;
            distance -= travel;
            entity.speed = speed;
        }

        if (distance < config.pedestrian_arrival_radius)
        {
            if (target.wait_for_signal && !signal.pedestriansCanGo())
            {
                entity.speed = 0.0;
                entity.activity = ActivityState::Waiting;
                entity.anim_frame = 0;
                return;
            }

            data->cursor += 1;
            if (data->cursor >= data->path.size())
            {
                entity.activity = ActivityState::Despawning;
                return;
            }

            const Vec2 next = data->path[data->cursor].position;
            double ndx = next.x - entity.position.x;
            double ndy = next.y - entity.position.y;
            if (ndx != 0.0 || ndy != 0.0)
            {
                entity.heading = quantizeHeading(ndx, ndy);
            }
            entity.speed = speed;
        }

        entity.activity = ActivityState::Moving;
        advanceAnimation(entity, dt_seconds, kWalkFrameSeconds, kWalkFrames);

        if (isOffScene(layout, entity.position, config.off_scene_margin))
        {
            entity.activity = ActivityState::Despawning;
        }
    }

} // namespace scramble
