#pragma once

namespace scramble
{

    enum class LightState
    {
        Red,
        Yellow,
        Green
    };

    enum class WalkState
    {
        DontWalk,
        Walk,
        Flashing
    };

    // Lamp aspects shown at the crossing. Both NS approaches share one aspect, as do both EW
    // approaches; all four pedestrian heads show the same aspect (scramble crossing).
    struct IntersectionState
    {
        LightState north_south{LightState::Red};
        LightState east_west{LightState::Red};
        WalkState pedestrians{WalkState::DontWalk};
        bool walk_lamp_lit{false}; // blink phase of the pedestrian head while Flashing
    };

    inline const char *toString(LightState state)
    {
        switch (state)
        {
        case LightState::Red:
            return "red";
        case LightState::Yellow:
            return "yellow";
        case LightState::Green:
            return "green";
        }
        return "red";
    }

    inline const char *toString(WalkState state)
    {
        switch (state)
        {
        case WalkState::DontWalk:
            return "stop";
        case WalkState::Walk:
            return "walk";
        case WalkState::Flashing:
            return "flash";
        }
        return "stop";
    }

} // namespace scramble
