#include <catch2/catch.hpp>

#include <oscil/scope/coord_transform.hpp>

using namespace oscil;
using namespace oscil::scope;

TEST_CASE("Scale state defaults", "[scope][transform]") {
    ScaleState scale{};

    CHECK(scale.TimeScaleFactor() == 4.0);
    CHECK(scale.AmpScaleFactor() == 2.0);
    CHECK(scale.AmpTranslation() == 0.5);
    CHECK_FALSE(scale.IsValid());
    CHECK(scale.TimeInPx() == 0.0);
    CHECK(scale.AmpInPx() == 0.0);
}

TEST_CASE("Scale state refreshes per-pixel factors", "[scope][transform]") {
    ScaleState scale{};
    scale.Resize({800, 400});

    REQUIRE(scale.IsValid());
    CHECK(scale.TimeInPx() == Approx(4.0 / 800.0));
    CHECK(scale.AmpInPx() == Approx(2.0 / 400.0));

    SECTION("on resize") {
        scale.Resize({200, 100});
        CHECK(scale.TimeInPx() == Approx(4.0 / 200.0));
        CHECK(scale.AmpInPx() == Approx(2.0 / 100.0));
    }

    SECTION("on scale factor changes") {
        scale.SetTimeScaleFactor(8.0);
        scale.SetAmpScaleFactor(1.0);
        CHECK(scale.TimeInPx() == Approx(8.0 / 800.0));
        CHECK(scale.AmpInPx() == Approx(1.0 / 400.0));
    }

    SECTION("to zero when the surface becomes empty") {
        scale.Resize({0, 400});
        CHECK_FALSE(scale.IsValid());
        CHECK(scale.TimeInPx() == 0.0);
        CHECK(scale.AmpInPx() == 0.0);
    }
}

TEST_CASE("Amplitude extremes map to the edges of the scaling range", "[scope][transform]") {
    Signal signal{};
    signal.Append({.time = 0.0, .amplitude = -3.0});
    signal.Append({.time = 0.1, .amplitude = 1.0});
    signal.Append({.time = 0.2, .amplitude = 5.0});
    const VisibleWindow window = SelectWindow(signal, 4.0, {});

    ScaleState scale{};
    scale.Resize({640, 480});
    scale.SetAmpTranslation(0.0);

    CHECK(AmpToPx(signal, window, scale, 0) == Approx(0.0));
    CHECK(AmpToPx(signal, window, scale, 2) == Approx(1.0 / scale.AmpInPx()));
    CHECK(AmpToPx(signal, window, scale, 1) == Approx(0.5 / scale.AmpInPx()));

    SECTION("translation shifts every point by the same amount") {
        scale.SetAmpTranslation(0.5);
        CHECK(AmpToPx(signal, window, scale, 0) == Approx(0.5 / scale.AmpInPx()));
        CHECK(AmpToPx(signal, window, scale, 2) == Approx(1.5 / scale.AmpInPx()));
    }
}

TEST_CASE("Flat signal renders as a translated line", "[scope][transform]") {
    Signal signal{};
    signal.Append({.time = 0.0, .amplitude = 7.0});
    signal.Append({.time = 0.5, .amplitude = 7.0});
    const VisibleWindow window = SelectWindow(signal, 4.0, {});
    REQUIRE(window.ampRange == 0.0);

    ScaleState scale{};
    scale.Resize({100, 100});

    CHECK(NormalizeAmp(7.0, window) == 0.0);
    CHECK(AmpToPx(signal, window, scale, 0) == Approx(0.5 / scale.AmpInPx()));
    CHECK(AmpToPx(signal, window, scale, 1) == Approx(0.5 / scale.AmpInPx()));
}

TEST_CASE("Time maps relative to the first sample and the window translation", "[scope][transform]") {
    Signal signal{};
    signal.Append({.time = 10.0, .amplitude = 0.0});
    signal.Append({.time = 11.0, .amplitude = 1.0});
    signal.Append({.time = 12.0, .amplitude = 0.0});

    ScaleState scale{};
    scale.Resize({400, 100});

    VisibleWindow window = SelectWindow(signal, 4.0, {});
    CHECK(TimeToPx(signal, window, scale, 0) == Approx(0.0));
    CHECK(TimeToPx(signal, window, scale, 2) == Approx(200.0));

    window.timeTranslation = 1.0;
    CHECK(TimeToPx(signal, window, scale, 1) == Approx(0.0));
    CHECK(TimeToPx(signal, window, scale, 2) == Approx(100.0));
}

TEST_CASE("Pixel centers map to clip space", "[scope][transform]") {
    CHECK(PxToPlaneX(-0.5, 100) == Approx(-1.0f));
    CHECK(PxToPlaneX(99.5, 100) == Approx(1.0f));
    CHECK(PxToPlaneX(49.5, 100) == Approx(0.0f).margin(1e-6));
    CHECK(PxToPlaneY(0.0, 2) == Approx(-0.5f));
    CHECK(PxToPlaneY(1.0, 2) == Approx(0.5f));
}
