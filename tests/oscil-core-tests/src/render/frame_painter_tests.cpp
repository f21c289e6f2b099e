#include <catch2/catch.hpp>

#include <oscil/render/frame_painter.hpp>
#include <oscil/renderer/scope_renderer_canvas.hpp>
#include <oscil/renderer/scope_renderer_null.hpp>

#include "recording_canvas.hpp"

using namespace oscil;
using namespace oscil::render;

TEST_CASE("Frame painter only paints while a surface is attached", "[render][frame]") {
    scope::Oscilloscope scope{};
    renderer::NullScopeRenderer renderer{};
    FramePainter painter{scope, renderer};
    surface::DrawTarget target{.canvas = nullptr, .size = {320, 200}};

    CHECK_FALSE(painter.IsAttached());
    CHECK_FALSE(painter.PaintFrame(target));
    CHECK(renderer.GetFrameCount() == 0);

    painter.OnSurfaceReady({320, 200});
    CHECK(painter.IsAttached());
    CHECK(painter.PaintFrame(target));
    CHECK(painter.PaintFrame(target));
    CHECK(renderer.GetFrameCount() == 2);

    painter.OnSurfaceDestroyed();
    CHECK_FALSE(painter.PaintFrame(target));
    CHECK(renderer.GetFrameCount() == 2);

    painter.OnSurfaceReady({320, 200});
    painter.Release();
    CHECK_FALSE(painter.IsAttached());
    CHECK_FALSE(painter.PaintFrame(target));
}

TEST_CASE("Frame painter sizes the oscilloscope to the surface", "[render][frame]") {
    scope::Oscilloscope scope{};
    renderer::NullScopeRenderer renderer{};
    FramePainter painter{scope, renderer};

    painter.OnSurfaceReady({800, 600});
    CHECK(scope.GetProbe().GetScaleState().Size() == scope::SurfaceSize{800, 600});

    painter.OnSurfaceResized({1024, 768});
    CHECK(scope.GetProbe().GetScaleState().Size() == scope::SurfaceSize{1024, 768});
}

TEST_CASE("Frame painter draws the last frame while inactive", "[render][frame]") {
    scope::Oscilloscope scope{};
    renderer::CanvasScopeRenderer renderer{};
    FramePainter painter{scope, renderer};
    painter.OnSurfaceReady({320, 200});

    for (int i = 0; i < 20; i++) {
        scope.Append({.time = i * 0.1, .amplitude = static_cast<float64>(i % 4)});
    }
    scope.SetActive(false);

    test::RecordingCanvas first{{320, 200}};
    surface::DrawTarget firstTarget{.canvas = &first, .size = {320, 200}};
    REQUIRE(painter.PaintFrame(firstTarget));

    test::RecordingCanvas second{{320, 200}};
    surface::DrawTarget secondTarget{.canvas = &second, .size = {320, 200}};
    REQUIRE(painter.PaintFrame(secondTarget));

    REQUIRE(first.lines.size() == 19);
    REQUIRE(second.lines.size() == first.lines.size());
    for (size_t i = 0; i < first.lines.size(); i++) {
        CHECK(second.lines[i].segment.x0 == first.lines[i].segment.x0);
        CHECK(second.lines[i].segment.y1 == first.lines[i].segment.y1);
    }
}
