#pragma once

#include "SceneLayout.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace scramble
{
    using EntityId = uint32_t;

    enum class EntityKind : uint8_t
    {
        Vehicle,
        Cyclist,
        Pedestrian
    };

    // Fine-grained speed control state for vehicles and cyclists.
    enum class SpeedState : uint8_t
    {
        Cruising,
        Accelerating,
        Decelerating,
        Stopped
    };

    // Coarse state read by the presentation layer and the reaping pass.
    enum class ActivityState : uint8_t
    {
        Moving,
        Waiting,
        Despawning
    };

    struct Waypoint
    {
        Vec2 position;
        bool wait_for_signal = false;
    };

    struct VehicleData
    {
        int lane = 0;
        double length = 0.0;          // along the travel axis
        bool passed_stop_line = false; // latched once the front edge crosses the stop line
    };

    struct PedestrianData
    {
        std::vector<Waypoint> path;
        std::size_t cursor = 1;
    };

    struct Entity
    {
        EntityId id = 0;
        EntityKind kind = EntityKind::Vehicle;
        Vec2 position;
        double speed = 0.0;
        double cruise_speed = 0.0;
        Heading heading = Heading::South;
        SpeedState speed_state = SpeedState::Cruising;
        ActivityState activity = ActivityState::Moving;
        std::string variant;
        std::string texture_key;

        // Presentation only.
        int anim_frame = 0;
        double anim_timer = 0.0;

        std::variant<VehicleData, PedestrianData> data;

        bool isTraffic() const { return kind == EntityKind::Vehicle || kind == EntityKind::Cyclist; }

        VehicleData *vehicleData() { return std::get_if<VehicleData>(&data); }
        const VehicleData *vehicleData() const { return std::get_if<VehicleData>(&data); }
        PedestrianData *pedestrianData() { return std::get_if<PedestrianData>(&data); }
        const PedestrianData *pedestrianData() const { return std::get_if<PedestrianData>(&data); }
    };

    inline const char *toString(EntityKind kind)
    {
        switch (kind)
        {
        case EntityKind::Vehicle:
            return "vehicle";
        case EntityKind::Cyclist:
            return "cyclist";
        case EntityKind::Pedestrian:
            return "pedestrian";
        }
        return "vehicle";
    }

    inline const char *toString(SpeedState state)
    {
        switch (state)
        {
        case SpeedState::Cruising:
            return "cruising";
        case SpeedState::Accelerating:
            return "accelerating";
        case SpeedState::Decelerating:
            return "decelerating";
        case SpeedState::Stopped:
            return "stopped";
        }
        return "cruising";
    }

    inline const char *toString(ActivityState state)
    {
        switch (state)
        {
        case ActivityState::Moving:
            return "moving";
        case ActivityState::Waiting:
            return "waiting";
        case ActivityState::Despawning:
            return "despawning";
        }
        return "moving";
    }

    // Builds a vehicle or cyclist travelling `heading` in `lane`, cruising at full speed.
    inline Entity makeTrafficEntity(EntityKind kind, Heading heading, int lane, Vec2 position,
                                    double cruise_speed, double length)
    {
        Entity entity;
        entity.kind = kind;
        entity.heading = heading;
        entity.position = position;
        entity.speed = cruise_speed;
        entity.cruise_speed = cruise_speed;
        entity.speed_state = SpeedState::Cruising;
        entity.activity = ActivityState::Moving;
        entity.data = VehicleData{lane, length, false};
        return entity;
    }

    // Builds a pedestrian standing on path[0] and walking toward path[1].
    inline Entity makePedestrianEntity(std::vector<Waypoint> path, double walk_speed)
    {
        Entity entity;
        entity.kind = EntityKind::Pedestrian;
        entity.position = path.empty() ? Vec2{} : path.front().position;
        entity.speed = walk_speed;
        entity.cruise_speed = walk_speed;
        entity.activity = ActivityState::Moving;
        entity.data = PedestrianData{std::move(path), 1};
        return entity;
    }

} // namespace scramble
