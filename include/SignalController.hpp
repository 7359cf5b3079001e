#pragma once

#include "Intersection.hpp"
#include "SceneLayout.hpp"
#include "SimulationConfig.hpp"

#include <array>
#include <cstddef>

namespace scramble
{
    enum class TrafficPhase
    {
        NS_GREEN = 0,
        NS_YELLOW,
        ALL_RED_1,
        EW_GREEN,
        EW_YELLOW,
        ALL_RED_2,
        SCRAMBLE,
        SCRAMBLE_FLASH,
        ALL_RED_3
    };

    constexpr std::size_t kPhaseCount = 9;

    const char *toString(TrafficPhase phase);
    TrafficPhase nextPhase(TrafficPhase phase);

    class SignalController
    {
    public:
        explicit SignalController(const SignalTimingConfig &timings = SignalTimingConfig{});

        // Advance the phase clock by dt_seconds. dt must be finite and non-negative.
        void advance(double dt_seconds);

        // Back to NS_GREEN with zero elapsed time.
        void reset();

        TrafficPhase phase() const { return current_phase; }
        double phaseElapsed() const { return phase_elapsed; }
        double phaseDuration(TrafficPhase phase) const;
        double cycleDuration() const;

        bool canGo(Heading heading) const;
        bool shouldSlow(Heading heading) const;
        bool pedestriansCanGo() const;
        bool pedestriansFlashing() const;

        // 2 Hz blink used by the pedestrian heads during SCRAMBLE_FLASH.
        bool walkLampLit() const;

        IntersectionState getCurrentState() const;

    private:
        std::array<double, kPhaseCount> durations;
        TrafficPhase current_phase;
        double phase_elapsed;
    };

} // namespace scramble
