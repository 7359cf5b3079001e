#include "TimeOfDay.hpp"

#include <cmath>

namespace scramble
{
    namespace
    {
        double wrapHour(double hour)
        {
            double wrapped = std::fmod(hour, 24.0);
            if (wrapped < 0.0)
            {
                wrapped += 24.0;
            }
            return wrapped;
        }
    }

    const char *toString(LightingPeriod period)
    {
        switch (period)
        {
        case LightingPeriod::Sunrise:
            return "sunrise";
        case LightingPeriod::Day:
            return "day";
        case LightingPeriod::Sunset:
            return "sunset";
        case LightingPeriod::Evening:
            return "evening";
        case LightingPeriod::Night:
            return "night";
        }
        return "day";
    }

    LightingPeriod lightingPeriodAt(double hour)
    {
        if (hour >= 6.0 && hour < 7.0)
            return LightingPeriod::Sunrise;
        if (hour >= 7.0 && hour < 17.0)
            return LightingPeriod::Day;
        if (hour >= 17.0 && hour < 18.5)
            return LightingPeriod::Sunset;
        if (hour >= 18.5 && hour < 21.0)
            return LightingPeriod::Evening;
        return LightingPeriod::Night;
    }

    LightingTint tintFor(LightingPeriod period)
    {
        switch (period)
        {
        case LightingPeriod::Sunrise:
            return {1.1, 1.0, 0.85, 1.0}; // warm orange
        case LightingPeriod::Day:
            return {1.0, 1.0, 1.0, 1.0};
        case LightingPeriod::Sunset:
            return {1.15, 0.9, 0.8, 1.0};
        case LightingPeriod::Evening:
            return {0.85, 0.85, 1.1, 0.85};
        case LightingPeriod::Night:
            return {0.7, 0.75, 1.2, 0.7};
        }
        return {};
    }

    TimeOfDay::TimeOfDay(double start_hour)
        : start_hour(wrapHour(start_hour)),
          current_hour(wrapHour(start_hour))
    {
    }

    void TimeOfDay::advance(double dt_seconds)
    {
        current_hour = wrapHour(current_hour + dt_seconds * GAME_MINUTES_PER_SECOND / 60.0);
    }

    void TimeOfDay::reset()
    {
        current_hour = start_hour;
    }

    void TimeOfDay::setHour(double hour)
    {
        current_hour = wrapHour(hour);
    }

} // namespace scramble
