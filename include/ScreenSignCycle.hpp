#pragma once

#include <cstdint>
#include <string>

namespace scramble
{
    // What the renderer draws for the video-screen facade on one frame.
    struct ScreenSignFrame
    {
        std::string texture_key;
        std::string next_texture_key; // overlay faded in on top; empty while holding
        double fade_progress = 0.0;   // overlay alpha in [0, 1)
        uint32_t glow_color = 0;      // 0xRRGGBB strip under the facade
        double glow_alpha = 0.35;
        int glow_height = 2;
    };

    // Screen is lit in its night variant from 18:30 until 06:00.
    bool isScreenNight(double hour);

    std::string screenSignTextureKey(int color_index, bool night);
    uint32_t screenGlowColor(int color_index, bool night);

    // Four-color cycle on the video screen: each color holds, then crossfades into the next.
    class ScreenSignCycle
    {
    public:
        static constexpr int COLOR_COUNT = 4;
        static constexpr double HOLD_DURATION = 2.0;
        static constexpr double FADE_DURATION = 0.3;
        static constexpr double CYCLE_DURATION = HOLD_DURATION + FADE_DURATION;

        void advance(double dt_seconds);
        void reset();

        int colorIndex() const { return color_index; }
        int nextColorIndex() const { return (color_index + 1) % COLOR_COUNT; }
        double elapsed() const { return color_elapsed; }
        bool fading() const { return color_elapsed >= HOLD_DURATION; }
        double fadeProgress() const;

        ScreenSignFrame frame(double hour) const;

    private:
        int color_index = 0;
        double color_elapsed = 0.0;
    };

} // namespace scramble
