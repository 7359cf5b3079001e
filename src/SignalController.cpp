#include "SignalController.hpp"

#include <cassert>
#include <cmath>

namespace scramble
{

    const char *toString(TrafficPhase phase)
    {
        switch (phase)
        {
        case TrafficPhase::NS_GREEN:
            return "NS_GREEN";
        case TrafficPhase::NS_YELLOW:
            return "NS_YELLOW";
        case TrafficPhase::ALL_RED_1:
            return "ALL_RED_1";
        case TrafficPhase::EW_GREEN:
            return "EW_GREEN";
        case TrafficPhase::EW_YELLOW:
            return "EW_YELLOW";
        case TrafficPhase::ALL_RED_2:
            return "ALL_RED_2";
        case TrafficPhase::SCRAMBLE:
            return "SCRAMBLE";
        case TrafficPhase::SCRAMBLE_FLASH:
            return "SCRAMBLE_FLASH";
        case TrafficPhase::ALL_RED_3:
            return "ALL_RED_3";
        }
        return "NS_GREEN";
    }

    TrafficPhase nextPhase(TrafficPhase phase)
    {
        std::size_t index = static_cast<std::size_t>(phase);
        return static_cast<TrafficPhase>((index + 1) % kPhaseCount);
    }

    SignalController::SignalController(const SignalTimingConfig &timings)
        : durations{timings.ns_green, timings.ns_yellow, timings.all_red_1,
                    timings.ew_green, timings.ew_yellow, timings.all_red_2,
                    timings.scramble, timings.scramble_flash, timings.all_red_3},
          current_phase(TrafficPhase::NS_GREEN),
          phase_elapsed(0.0)
    {
    }

    void SignalController::reset()
    {
        current_phase = TrafficPhase::NS_GREEN;
        phase_elapsed = 0.0;
    }

    double SignalController::phaseDuration(TrafficPhase phase) const
    {
        return durations[static_cast<std::size_t>(phase)];
    }

    double SignalController::cycleDuration() const
    {
        double total = 0.0;
        for (double duration : durations)
        {
            total += duration;
        }
        return total;
    }

    void SignalController::advance(double dt_seconds)
    {
        assert(std::isfinite(dt_seconds) && dt_seconds >= 0.0);

        if (cycleDuration() <= 0.0)
        {
            return;
        }

        phase_elapsed += dt_seconds;

        // Carry the remainder into the next phase; loop only matters when dt spans a whole phase
        while (phase_elapsed >= phaseDuration(current_phase))
        {
            phase_elapsed -= phaseDuration(current_phase);
            current_phase = nextPhase(current_phase);
        }
    }

    bool SignalController::canGo(Heading heading) const
    {
        if (axisOf(heading) == Axis::NorthSouth)
        {
            return current_phase == TrafficPhase::NS_GREEN;
        }
        return current_phase == TrafficPhase::EW_GREEN;
    }

    bool SignalController::shouldSlow(Heading heading) const
    {
        if (axisOf(heading) == Axis::NorthSouth)
        {
            return current_phase == TrafficPhase::NS_YELLOW;
        }
        return current_phase == TrafficPhase::EW_YELLOW;
    }

    bool SignalController::pedestriansCanGo() const
    {
        return current_phase == TrafficPhase::SCRAMBLE;
    }

    bool SignalController::pedestriansFlashing() const
    {
        return current_phase == TrafficPhase::SCRAMBLE_FLASH;
    }

    bool SignalController::walkLampLit() const
    {
        if (pedestriansCanGo())
        {
            return true;
        }
        if (pedestriansFlashing())
        {
            return static_cast<long>(std::floor(phase_elapsed * 2.0)) % 2 == 0;
        }
        return false;
    }

    IntersectionState SignalController::getCurrentState() const
    {
        IntersectionState state;

        switch (current_phase)
        {
        case TrafficPhase::NS_GREEN:
            state.north_south = LightState::Green;
            break;
        case TrafficPhase::NS_YELLOW:
            state.north_south = LightState::Yellow;
            break;
        case TrafficPhase::EW_GREEN:
            state.east_west = LightState::Green;
            break;
        case TrafficPhase::EW_YELLOW:
            state.east_west = LightState::Yellow;
            break;
        case TrafficPhase::SCRAMBLE:
            state.pedestrians = WalkState::Walk;
            break;
        case TrafficPhase::SCRAMBLE_FLASH:
            state.pedestrians = WalkState::Flashing;
            break;
        case TrafficPhase::ALL_RED_1:
        case TrafficPhase::ALL_RED_2:
        case TrafficPhase::ALL_RED_3:
            break;
        }

        state.walk_lamp_lit = walkLampLit();
        return state;
    }

} // namespace scramble
