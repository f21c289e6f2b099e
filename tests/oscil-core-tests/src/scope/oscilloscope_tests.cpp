#include <catch2/catch.hpp>

#include <oscil/renderer/scope_renderer_null.hpp>
#include <oscil/scope/oscilloscope.hpp>

#include <cmath>
#include <limits>
#include <thread>

using namespace oscil;
using namespace oscil::scope;

namespace oscilloscope_tests {

void Feed(Oscilloscope &scope, int count, float64 startTime = 0.0) {
    for (int i = 0; i < count; i++) {
        scope.Append({.time = startTime + i * 0.1, .amplitude = std::sin(i * 0.2)});
    }
}

} // namespace oscilloscope_tests

using oscilloscope_tests::Feed;

TEST_CASE("Oscilloscope starts active with default settings", "[scope][oscilloscope]") {
    Oscilloscope scope{};
    const auto &probe = scope.GetProbe();

    CHECK(probe.IsActive());
    CHECK(probe.GetSampleCount() == 0);
    CHECK(probe.GetVisibleWindow() == VisibleWindow{});

    const ScaleState scale = probe.GetScaleState();
    CHECK(scale.TimeScaleFactor() == 4.0);
    CHECK(scale.AmpScaleFactor() == 2.0);
    CHECK(scale.AmpTranslation() == 0.5);

    const PaintStyle style = probe.GetPaintStyle();
    CHECK(style.strokeWidth == 7.0f);
    CHECK(style.strokeColor == kBlack);
    CHECK_FALSE(style.backgroundColor.has_value());

    CHECK(probe.GetHistoryPolicy() == HistoryPolicy::Unbounded);
    CHECK_FALSE(probe.IsRejectingOutOfOrderSamples());
}

TEST_CASE("Oscilloscope recomputes the window and primitive on append", "[scope][oscilloscope]") {
    Oscilloscope scope{};
    scope.Resize({400, 300});
    Feed(scope, 100);

    const auto &probe = scope.GetProbe();
    const VisibleWindow window = probe.GetVisibleWindow();
    CHECK(probe.GetSampleCount() == 100);
    CHECK(window.endIndex == 99);
    CHECK(window.beginIndex > 0);

    const LineStrip strip = probe.GetLineStrip();
    CHECK(strip.PointCount() == window.PointCount());
    CHECK(strip.lineCount == window.endIndex - window.beginIndex);
}

TEST_CASE("Activating the oscilloscope resets all data", "[scope][oscilloscope]") {
    Oscilloscope scope{};
    scope.Resize({400, 300});
    Feed(scope, 100);

    scope.SetActive(true);

    const auto &probe = scope.GetProbe();
    CHECK(probe.IsActive());
    CHECK(probe.GetSampleCount() == 0);
    CHECK(probe.GetRetainedSampleCount() == 0);
    CHECK(probe.GetVisibleWindow() == VisibleWindow{});
    CHECK(probe.GetLineStrip().vertices.empty());
    CHECK(probe.GetLineStrip().lineCount == 0);

    SECTION("the next session starts from its own first sample") {
        Feed(scope, 10, 50.0);
        const VisibleWindow window = probe.GetVisibleWindow();
        CHECK(window.beginIndex == 0);
        CHECK(window.endIndex == 9);
        CHECK(window.timeTranslation == 0.0);
    }
}

TEST_CASE("Deactivating the oscilloscope keeps the last primitive", "[scope][oscilloscope]") {
    Oscilloscope scope{};
    scope.Resize({400, 300});
    Feed(scope, 60);

    const LineStrip before = scope.GetProbe().GetLineStrip();
    scope.SetActive(false);

    const auto &probe = scope.GetProbe();
    CHECK_FALSE(probe.IsActive());
    CHECK(probe.GetSampleCount() == 60);
    CHECK(probe.GetLineStrip().vertices == before.vertices);
    CHECK(probe.GetLineStrip().lineCount == before.lineCount);

    renderer::NullScopeRenderer renderer{};
    surface::DrawTarget target{.canvas = nullptr, .size = {400, 300}};
    scope.Paint(renderer, target);
    CHECK(renderer.GetFrameCount() == 1);
    CHECK(probe.GetLineStrip().vertices == before.vertices);
}

TEST_CASE("Out-of-order samples are accepted by default", "[scope][oscilloscope]") {
    Oscilloscope scope{};
    CHECK(scope.Append({.time = 1.0, .amplitude = 0.0}));
    CHECK(scope.Append({.time = 0.5, .amplitude = 1.0}));
    CHECK(scope.GetProbe().GetSampleCount() == 2);
}

TEST_CASE("Out-of-order samples can be rejected", "[scope][oscilloscope]") {
    Oscilloscope scope{};
    scope.SetRejectOutOfOrderSamples(true);
    REQUIRE(scope.Append({.time = 1.0, .amplitude = 0.0}));

    const VisibleWindow before = scope.GetProbe().GetVisibleWindow();
    CHECK_FALSE(scope.Append({.time = 0.5, .amplitude = 1.0}));
    CHECK(scope.GetProbe().GetSampleCount() == 1);
    CHECK(scope.GetProbe().GetVisibleWindow() == before);

    // Equal timestamps are not out of order
    CHECK(scope.Append({.time = 1.0, .amplitude = 2.0}));
    CHECK(scope.GetProbe().GetSampleCount() == 2);
}

TEST_CASE("Invalid configuration values are ignored", "[scope][oscilloscope]") {
    Oscilloscope scope{};
    const float64 nan = std::numeric_limits<float64>::quiet_NaN();
    const float64 inf = std::numeric_limits<float64>::infinity();

    scope.SetTimeScaleFactor(0.0);
    scope.SetTimeScaleFactor(-1.0);
    scope.SetTimeScaleFactor(nan);
    scope.SetAmpScaleFactor(0.0);
    scope.SetAmpScaleFactor(inf);
    scope.SetAmpTranslation(nan);
    scope.SetStrokeWidth(-2.0f);

    const auto &probe = scope.GetProbe();
    CHECK(probe.GetScaleState().TimeScaleFactor() == 4.0);
    CHECK(probe.GetScaleState().AmpScaleFactor() == 2.0);
    CHECK(probe.GetScaleState().AmpTranslation() == 0.5);
    CHECK(probe.GetPaintStyle().strokeWidth == 7.0f);

    scope.SetAmpTranslation(-0.25);
    scope.SetStrokeWidth(0.0f);
    CHECK(probe.GetScaleState().AmpTranslation() == -0.25);
    CHECK(probe.GetPaintStyle().strokeWidth == 0.0f);
}

TEST_CASE("Amplitude settings rebuild the primitive immediately", "[scope][oscilloscope]") {
    Oscilloscope scope{};
    scope.Resize({400, 300});
    Feed(scope, 50);
    const LineStrip before = scope.GetProbe().GetLineStrip();

    scope.SetAmpTranslation(0.0);
    const LineStrip after = scope.GetProbe().GetLineStrip();

    REQUIRE(after.PointCount() == before.PointCount());
    CHECK(after.vertices != before.vertices);
    CHECK(after.vertices[0] == before.vertices[0]);
}

TEST_CASE("Time scale changes recompute the window right away", "[scope][oscilloscope]") {
    Oscilloscope scope{};
    scope.Resize({400, 300});
    Feed(scope, 100);
    const VisibleWindow before = scope.GetProbe().GetVisibleWindow();
    const LineStrip stripBefore = scope.GetProbe().GetLineStrip();

    scope.SetTimeScaleFactor(8.0);
    const VisibleWindow rescaled = scope.GetProbe().GetVisibleWindow();
    CHECK(rescaled.endIndex == 99);
    CHECK(rescaled.beginIndex < before.beginIndex);
    CHECK(rescaled.timeTranslation == Approx(1.9));

    const LineStrip stripAfter = scope.GetProbe().GetLineStrip();
    CHECK(stripAfter.PointCount() == rescaled.PointCount());
    CHECK(stripAfter.vertices != stripBefore.vertices);

    scope.Append({.time = 10.0, .amplitude = 0.0});
    const VisibleWindow after = scope.GetProbe().GetVisibleWindow();
    CHECK(after.endIndex == 100);
    CHECK(after.beginIndex >= rescaled.beginIndex);
    CHECK(after.timeTranslation == Approx(2.0));
}

TEST_CASE("Time scale changes on an empty oscilloscope apply to the first samples", "[scope][oscilloscope]") {
    Oscilloscope scope{};
    scope.SetTimeScaleFactor(2.0);
    CHECK(scope.GetProbe().GetVisibleWindow() == VisibleWindow{});

    Feed(scope, 50);
    const VisibleWindow window = scope.GetProbe().GetVisibleWindow();
    CHECK(window.endIndex == 49);
    CHECK(window.timeTranslation == Approx(2.9));
}

TEST_CASE("Non-finite samples are rejected", "[scope][oscilloscope]") {
    Oscilloscope scope{};
    scope.Resize({400, 300});
    Feed(scope, 10);
    const VisibleWindow before = scope.GetProbe().GetVisibleWindow();

    const float64 nan = std::numeric_limits<float64>::quiet_NaN();
    const float64 inf = std::numeric_limits<float64>::infinity();
    CHECK_FALSE(scope.Append({.time = inf, .amplitude = 0.0}));
    CHECK_FALSE(scope.Append({.time = nan, .amplitude = 0.0}));
    CHECK_FALSE(scope.Append({.time = 5.0, .amplitude = -inf}));
    CHECK_FALSE(scope.Append({.time = 5.0, .amplitude = nan}));

    CHECK(scope.GetProbe().GetSampleCount() == 10);
    CHECK(scope.GetProbe().GetVisibleWindow() == before);
}

TEST_CASE("Resizing rebuilds the primitive for the new surface", "[scope][oscilloscope]") {
    Oscilloscope scope{};
    Feed(scope, 20);
    CHECK(scope.GetProbe().GetLineStrip().vertices.empty());

    scope.Resize({400, 300});
    CHECK(scope.GetProbe().GetLineStrip().PointCount() == 20);

    scope.Resize({0, 0});
    CHECK(scope.GetProbe().GetLineStrip().vertices.empty());
}

TEST_CASE("Trimming history keeps windowing identical", "[scope][oscilloscope]") {
    Oscilloscope unbounded{};
    Oscilloscope trimmed{};
    unbounded.Resize({400, 300});
    trimmed.Resize({400, 300});
    trimmed.SetHistoryPolicy(HistoryPolicy::TrimBeforeWindow);

    Feed(unbounded, 500);
    Feed(trimmed, 500);

    CHECK(trimmed.GetProbe().GetSampleCount() == 500);
    CHECK(trimmed.GetProbe().GetRetainedSampleCount() < 500);
    CHECK(unbounded.GetProbe().GetRetainedSampleCount() == 500);
    CHECK(trimmed.GetProbe().GetVisibleWindow() == unbounded.GetProbe().GetVisibleWindow());
    CHECK(trimmed.GetProbe().GetLineStrip().vertices == unbounded.GetProbe().GetLineStrip().vertices);
}

TEST_CASE("Trimmed history stays anchored when the time scale grows", "[scope][oscilloscope]") {
    Oscilloscope unbounded{};
    Oscilloscope trimmed{};
    unbounded.Resize({400, 300});
    trimmed.Resize({400, 300});
    trimmed.SetHistoryPolicy(HistoryPolicy::TrimBeforeWindow);

    Feed(unbounded, 200);
    Feed(trimmed, 200);
    const size_t retainedFrom = trimmed.GetProbe().GetVisibleWindow().beginIndex;

    unbounded.SetTimeScaleFactor(8.0);
    trimmed.SetTimeScaleFactor(8.0);
    unbounded.Append({.time = 20.0, .amplitude = 0.0});
    trimmed.Append({.time = 20.0, .amplitude = 0.0});

    // Unbounded history widens the window backwards
    const VisibleWindow full = unbounded.GetProbe().GetVisibleWindow();
    CHECK(full.beginIndex < retainedFrom);
    CHECK(full.timeTranslation == Approx(12.0));

    // Evicted samples cannot come back: the oldest retained sample sits on the left edge
    const VisibleWindow window = trimmed.GetProbe().GetVisibleWindow();
    CHECK(window.beginIndex == retainedFrom);
    CHECK(window.endIndex == 200);
    CHECK(window.timeTranslation == Approx(retainedFrom * 0.1));

    const LineStrip strip = trimmed.GetProbe().GetLineStrip();
    REQUIRE(strip.PointCount() == window.PointCount());
    CHECK(strip.vertices[0] == Approx(PxToPlaneX(0.0, 400)).margin(1e-5));
    CHECK(strip.vertices[strip.vertices.size() - 2] < 1.0f);

    SECTION("and converges back to the unbounded window once the span is filled") {
        for (int i = 201; i < 300; i++) {
            unbounded.Append({.time = i * 0.1, .amplitude = 0.0});
            trimmed.Append({.time = i * 0.1, .amplitude = 0.0});
        }
        CHECK(trimmed.GetProbe().GetVisibleWindow() == unbounded.GetProbe().GetVisibleWindow());
    }
}

TEST_CASE("Oscilloscope follows the configuration", "[scope][oscilloscope][config]") {
    core::Configuration config{};
    config.scope.strokeWidth = 3.0f;

    Oscilloscope scope{config};
    const auto &probe = scope.GetProbe();
    CHECK(probe.GetPaintStyle().strokeWidth == 3.0f);

    config.scope.ampScaleFactor = 4.0;
    config.scope.ampTranslation = 1.0;
    config.scope.strokeColor = Color{1.0f, 0.0f, 0.0f, 1.0f};
    config.scope.backgroundColor = Color{1.0f, 1.0f, 1.0f, 1.0f};
    config.scope.historyPolicy = HistoryPolicy::TrimBeforeWindow;
    config.scope.rejectOutOfOrderSamples = true;

    CHECK(probe.GetScaleState().AmpScaleFactor() == 4.0);
    CHECK(probe.GetScaleState().AmpTranslation() == 1.0);
    CHECK(probe.GetPaintStyle().strokeColor == Color{1.0f, 0.0f, 0.0f, 1.0f});
    CHECK(probe.GetPaintStyle().backgroundColor == Color{1.0f, 1.0f, 1.0f, 1.0f});
    CHECK(probe.GetHistoryPolicy() == HistoryPolicy::TrimBeforeWindow);
    CHECK(probe.IsRejectingOutOfOrderSamples());

    config.scope.timeScaleFactor = -1.0;
    CHECK(probe.GetScaleState().TimeScaleFactor() == 4.0);
}

TEST_CASE("Oscilloscope stops following the configuration once destroyed", "[scope][oscilloscope][config]") {
    core::Configuration config{};
    {
        Oscilloscope scope{config};
        CHECK(config.scope.timeScaleFactor.GetObserverCount() == 1);
        CHECK(config.scope.rejectOutOfOrderSamples.GetObserverCount() == 1);
    }
    CHECK(config.scope.timeScaleFactor.GetObserverCount() == 0);
    CHECK(config.scope.backgroundColor.GetObserverCount() == 0);

    // Must not reach the destroyed oscilloscope
    config.scope.timeScaleFactor = 3.0;
    config.scope.strokeColor = Color{1.0f, 0.0f, 0.0f, 1.0f};

    Oscilloscope other{config};
    CHECK(other.GetProbe().GetScaleState().TimeScaleFactor() == 3.0);
    config.scope.ampTranslation = 0.25;
    CHECK(other.GetProbe().GetScaleState().AmpTranslation() == 0.25);
}

TEST_CASE("Concurrent appends and paints stay consistent", "[scope][oscilloscope][concurrency]") {
    Oscilloscope scope{};
    scope.Resize({400, 300});
    renderer::NullScopeRenderer renderer{};

    std::thread producer{[&] { Feed(scope, 2000); }};
    surface::DrawTarget target{.canvas = nullptr, .size = {400, 300}};
    for (int i = 0; i < 200; i++) {
        scope.Paint(renderer, target);
        const VisibleWindow window = scope.GetProbe().GetVisibleWindow();
        REQUIRE(window.beginIndex <= window.endIndex);
    }
    producer.join();

    CHECK(renderer.GetFrameCount() == 200);
    CHECK(scope.GetProbe().GetSampleCount() == 2000);
    CHECK(scope.GetProbe().GetVisibleWindow().endIndex == 1999);
}
