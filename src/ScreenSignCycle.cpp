#include "ScreenSignCycle.hpp"

namespace scramble
{
    namespace
    {
        // blue, pink, green, yellow
        constexpr uint32_t kDayGlow[ScreenSignCycle::COLOR_COUNT] = {0x41a6f6, 0xef7d8e, 0xa7f070, 0xffcd75};
        constexpr uint32_t kNightGlow[ScreenSignCycle::COLOR_COUNT] = {0x73eff7, 0xff6b9d, 0x8aff70, 0xf7e476};

        int wrapIndex(int color_index)
        {
            return ((color_index % ScreenSignCycle::COLOR_COUNT) + ScreenSignCycle::COLOR_COUNT) %
                   ScreenSignCycle::COLOR_COUNT;
        }
    }

    bool isScreenNight(double hour)
    {
        return hour >= 18.5 || hour < 6.0;
    }

    std::string screenSignTextureKey(int color_index, bool night)
    {
        std::string key = "bldg_qfront_n_c" + std::to_string(wrapIndex(color_index));
        if (night)
        {
            key += "_night";
        }
        return key;
    }

    uint32_t screenGlowColor(int color_index, bool night)
    {
        return night ? kNightGlow[wrapIndex(color_index)] : kDayGlow[wrapIndex(color_index)];
    }

    void ScreenSignCycle::advance(double dt_seconds)
    {
        color_elapsed += dt_seconds;
        while (color_elapsed >= CYCLE_DURATION)
        {
            color_elapsed -= CYCLE_DURATION;
            color_index = nextColorIndex();
        }
    }

    void ScreenSignCycle::reset()
    {
        color_index = 0;
        color_elapsed = 0.0;
    }

    double ScreenSignCycle::fadeProgress() const
    {
        if (!fading())
        {
            return 0.0;
        }
        return (color_elapsed - HOLD_DURATION) / FADE_DURATION;
    }

    ScreenSignFrame ScreenSignCycle::frame(double hour) const
    {
        const bool night = isScreenNight(hour);

        ScreenSignFrame out;
        out.texture_key = screenSignTextureKey(color_index, night);
        if (fading())
        {
            out.next_texture_key = screenSignTextureKey(nextColorIndex(), night);
            out.fade_progress = fadeProgress();
        }
        // The glow follows the settled color, not the incoming one
        out.glow_color = screenGlowColor(color_index, night);
        out.glow_alpha = night ? 0.5 : 0.35;
        out.glow_height = night ? 3 : 2;
        return out;
    }

} // namespace scramble
