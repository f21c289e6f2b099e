#include <oscil/renderer/scope_renderer_canvas.hpp>

#include <oscil/util/dev_log.hpp>
#include <oscil/util/scope_guard.hpp>

namespace oscil::renderer {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // base

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Renderer-Canvas";
    };

} // namespace grp

CanvasScopeRenderer::CanvasScopeRenderer()
    : IScopeRenderer(ScopeRendererType::Canvas) {}

void CanvasScopeRenderer::Render(const scope::ScopeState &state, surface::DrawTarget &target) {
    surface::ICanvas *canvas = target.canvas;
    if (canvas == nullptr) {
        devlog::warn<grp::base>("Draw target has no canvas; frame skipped");
        return;
    }

    const scope::SurfaceSize size = canvas->GetSize();

    canvas->Save();
    util::ScopeGuard sgRestore{[&] { canvas->Restore(); }};

    // Flip vertically so that Y grows upwards
    canvas->Translate(0.0f, static_cast<float32>(size.height));
    canvas->Scale(1.0f, -1.0f);

    canvas->Clear(scope::kTransparent);
    if (state.style.backgroundColor) {
        canvas->Fill(*state.style.backgroundColor);
    }

    const surface::Stroke stroke{.width = state.style.strokeWidth, .color = state.style.strokeColor};
    scope::ForEachSegment(state.signal, state.window, state.scale,
                          [&](const scope::LineSegment &segment) { canvas->DrawLine(segment, stroke); });
}

} // namespace oscil::renderer
