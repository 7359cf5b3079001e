#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace scramble
{
    // Eight-way compass heading. Vehicles and cyclists only use the four cardinal values.
    enum class Heading : uint8_t
    {
        North = 0,
        NorthEast = 1,
        East = 2,
        SouthEast = 3,
        South = 4,
        SouthWest = 5,
        West = 6,
        NorthWest = 7
    };

    enum class Axis : uint8_t
    {
        NorthSouth,
        EastWest
    };

    enum class Corner : uint8_t
    {
        NorthWest = 0,
        NorthEast = 1,
        SouthEast = 2,
        SouthWest = 3
    };

    struct Vec2
    {
        double x = 0.0;
        double y = 0.0;
    };

    constexpr std::array<Heading, 4> kCardinalHeadings = {Heading::North, Heading::South, Heading::East, Heading::West};

    inline bool isCardinal(Heading heading)
    {
        return heading == Heading::North || heading == Heading::East ||
               heading == Heading::South || heading == Heading::West;
    }

    inline Axis axisOf(Heading heading)
    {
        return (heading == Heading::North || heading == Heading::South) ? Axis::NorthSouth : Axis::EastWest;
    }

    inline const char *toString(Heading heading)
    {
        switch (heading)
        {
        case Heading::North:
            return "n";
        case Heading::NorthEast:
            return "ne";
        case Heading::East:
            return "e";
        case Heading::SouthEast:
            return "se";
        case Heading::South:
            return "s";
        case Heading::SouthWest:
            return "sw";
        case Heading::West:
            return "w";
        case Heading::NorthWest:
            return "nw";
        }
        return "n";
    }

    inline std::optional<Heading> headingFromString(const std::string &value)
    {
        for (uint8_t i = 0; i < 8; ++i)
        {
            Heading heading = static_cast<Heading>(i);
            if (value == toString(heading))
            {
                return heading;
            }
        }
        return std::nullopt;
    }

    // Fixed scene geometry shared by the kinematics and the spawner. Scene units are pixels of
    // the diorama; y grows southward.
    struct SceneLayout
    {
        double scene_width = 480.0;
        double scene_height = 480.0;
        double lane_width = 24.0;
        int lanes_per_road = 4;
        double zebra_width = 24.0;
        double stop_line_setback = 24.0; // gap between the crosswalk's outer edge and the stop line

        double roadWidth() const { return lane_width * lanes_per_road; }
        double centerX() const { return scene_width / 2.0; }
        double centerY() const { return scene_height / 2.0; }

        double nsRoadLeft() const { return centerX() - roadWidth() / 2.0; }
        double nsRoadRight() const { return centerX() + roadWidth() / 2.0; }
        double ewRoadTop() const { return centerY() - roadWidth() / 2.0; }
        double ewRoadBottom() const { return centerY() + roadWidth() / 2.0; }

        // NS road: lanes [0, half) run south, [half, lanes) run north.
        double nsLaneX(int lane) const { return nsRoadLeft() + lane * lane_width + lane_width / 2.0; }

        // EW road: lanes [0, half) run east, [half, lanes) run west.
        double ewLaneY(int lane) const { return ewRoadTop() + lane * lane_width + lane_width / 2.0; }

        // Cross-axis coordinate of a lane for a cardinal heading.
        double laneCenter(Heading heading, int lane) const
        {
            return axisOf(heading) == Axis::NorthSouth ? nsLaneX(lane) : ewLaneY(lane);
        }

        // Travel-axis coordinate of the stop line for traffic moving in `heading`.
        double stopLine(Heading heading) const
        {
            switch (heading)
            {
            case Heading::South:
                return ewRoadTop() - zebra_width - stop_line_setback;
            case Heading::North:
                return ewRoadBottom() + zebra_width + stop_line_setback;
            case Heading::East:
                return nsRoadLeft() - zebra_width - stop_line_setback;
            case Heading::West:
                return nsRoadRight() + zebra_width + stop_line_setback;
            default:
                return 0.0;
            }
        }

        // Sidewalk corner where the two crosswalks of that corner meet.
        Vec2 cornerPoint(Corner corner) const
        {
            const double west_x = nsRoadLeft() - zebra_width / 2.0;
            const double east_x = nsRoadRight() + zebra_width / 2.0;
            const double north_y = ewRoadTop() - zebra_width / 2.0;
            const double south_y = ewRoadBottom() + zebra_width / 2.0;
            switch (corner)
            {
            case Corner::NorthWest:
                return {west_x, north_y};
            case Corner::NorthEast:
                return {east_x, north_y};
            case Corner::SouthEast:
                return {east_x, south_y};
            case Corner::SouthWest:
                return {west_x, south_y};
            }
            return {west_x, north_y};
        }
    };

    inline SceneLayout makeDefaultSceneLayout()
    {
        return SceneLayout{};
    }

    // Lanes available to vehicles heading in `heading`.
    inline std::array<int, 2> vehicleLanesFor(const SceneLayout &layout, Heading heading)
    {
        const int half = layout.lanes_per_road / 2;
        if (heading == Heading::South || heading == Heading::East)
        {
            return {0, half > 1 ? 1 : 0};
        }
        return {layout.lanes_per_road - (half > 1 ? 2 : 1), layout.lanes_per_road - 1};
    }

    // Outermost lane, used by cyclists.
    inline int curbLaneFor(const SceneLayout &layout, Heading heading)
    {
        if (heading == Heading::South || heading == Heading::East)
        {
            return 0;
        }
        return layout.lanes_per_road - 1;
    }

} // namespace scramble
