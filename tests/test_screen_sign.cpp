#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include "ScreenSignCycle.hpp"
#include "SimulatorEngine.hpp"

using namespace scramble;

TEST_CASE("Screen holds a color then crossfades into the next", "[screen]")
{
    ScreenSignCycle cycle;
    REQUIRE(cycle.colorIndex() == 0);
    REQUIRE_FALSE(cycle.fading());

    cycle.advance(1.5);
    ScreenSignFrame holding = cycle.frame(12.0);
    REQUIRE(holding.texture_key == "bldg_qfront_n_c0");
    REQUIRE(holding.next_texture_key.empty());
    REQUIRE(holding.fade_progress == 0.0);

    cycle.advance(0.65);
    REQUIRE(cycle.fading());
    ScreenSignFrame fading = cycle.frame(12.0);
    REQUIRE(fading.texture_key == "bldg_qfront_n_c0");
    REQUIRE(fading.next_texture_key == "bldg_qfront_n_c1");
    REQUIRE(fading.fade_progress == Catch::Detail::Approx(0.5));
    REQUIRE(fading.glow_color == 0x41a6f6u);

    // Fade finishes at 2.3 s; the remainder carries into the next color
    cycle.advance(0.2);
    REQUIRE(cycle.colorIndex() == 1);
    REQUIRE(cycle.elapsed() == Catch::Detail::Approx(0.05));
    REQUIRE_FALSE(cycle.fading());
    REQUIRE(cycle.frame(12.0).glow_color == 0xef7d8eu);
}

TEST_CASE("Screen color wraps after the fourth color", "[screen]")
{
    ScreenSignCycle cycle;
    cycle.advance(3 * ScreenSignCycle::CYCLE_DURATION + 0.1);
    REQUIRE(cycle.colorIndex() == 3);
    REQUIRE(cycle.nextColorIndex() == 0);

    // One large step crosses several colors
    cycle.advance(2 * ScreenSignCycle::CYCLE_DURATION);
    REQUIRE(cycle.colorIndex() == 1);
    REQUIRE(cycle.elapsed() == Catch::Detail::Approx(0.1));

    cycle.reset();
    REQUIRE(cycle.colorIndex() == 0);
    REQUIRE(cycle.elapsed() == 0.0);
}

TEST_CASE("Night screen textures run from evening to dawn", "[screen]")
{
    REQUIRE_FALSE(isScreenNight(12.0));
    REQUIRE_FALSE(isScreenNight(18.4));
    REQUIRE(isScreenNight(18.5));
    REQUIRE(isScreenNight(23.9));
    REQUIRE(isScreenNight(5.9));
    REQUIRE_FALSE(isScreenNight(6.0));

    ScreenSignCycle cycle;
    ScreenSignFrame night = cycle.frame(22.0);
    REQUIRE(night.texture_key == "bldg_qfront_n_c0_night");
    REQUIRE(night.glow_color == 0x73eff7u);
    REQUIRE(night.glow_alpha == Catch::Detail::Approx(0.5));
    REQUIRE(night.glow_height == 3);

    ScreenSignFrame day = cycle.frame(9.0);
    REQUIRE(day.glow_alpha == Catch::Detail::Approx(0.35));
    REQUIRE(day.glow_height == 2);

    REQUIRE(screenSignTextureKey(2, false) == "bldg_qfront_n_c2");
    REQUIRE(screenGlowColor(3, true) == 0xf7e476u);
}

TEST_CASE("Engine advances the screen and reports it in the snapshot", "[screen][engine]")
{
    SimulationConfig config = makeDefaultSimulationConfig();
    config.start_time_of_day = 20.0;
    SimulatorEngine engine(config);
    engine.setSpawningEnabled(false);
    engine.start();

    // 2.5 s of ticks: past the first color's cycle, holding the second
    for (int i = 0; i < 75; ++i)
    {
        engine.tick(1.0 / 30.0);
    }
    REQUIRE(engine.getScreenSign().colorIndex() == 1);

    nlohmann::json snapshot = nlohmann::json::parse(engine.getSnapshotJson());
    REQUIRE(snapshot["screen_sign"]["texture"].get<std::string>() == "bldg_qfront_n_c1_night");
    REQUIRE(snapshot["screen_sign"]["next_texture"].get<std::string>().empty());
    REQUIRE(snapshot["screen_sign"]["glow_color"].get<uint32_t>() == 0xff6b9du);
    REQUIRE(engine.getTextures().find(snapshot["screen_sign"]["texture"].get<std::string>()).has_value());

    engine.handleCommand(SimulatorEngine::UICommand::Reset);
    REQUIRE(engine.getScreenSign().colorIndex() == 0);
}
