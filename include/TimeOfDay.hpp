#pragma once

namespace scramble
{
    enum class LightingPeriod
    {
        Sunrise,
        Day,
        Sunset,
        Evening,
        Night
    };

    // Color multiplier applied to the whole scene by the renderer.
    struct LightingTint
    {
        double red = 1.0;
        double green = 1.0;
        double blue = 1.0;
        double brightness = 1.0;
    };

    const char *toString(LightingPeriod period);
    LightingPeriod lightingPeriodAt(double hour);
    LightingTint tintFor(LightingPeriod period);

    // Game clock in hours [0, 24). One real second advances one game minute.
    class TimeOfDay
    {
    public:
        static constexpr double GAME_MINUTES_PER_SECOND = 1.0;

        explicit TimeOfDay(double start_hour = 12.0);

        void advance(double dt_seconds);
        void reset();
        void setHour(double hour);

        double hour() const { return current_hour; }
        LightingPeriod period() const { return lightingPeriodAt(current_hour); }
        LightingTint tint() const { return tintFor(period()); }

    private:
        double start_hour;
        double current_hour;
    };

} // namespace scramble
