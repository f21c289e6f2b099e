#pragma once

#include <oscil/renderer/scope_renderer_base.hpp>

namespace oscil::renderer {

/// @brief Renderer that strokes the visible window segment by segment on a 2D canvas.
///
/// The canvas is flipped vertically for the duration of the frame so that amplitudes grow upwards.
class CanvasScopeRenderer : public IScopeRenderer {
public:
    CanvasScopeRenderer();

    void Render(const scope::ScopeState &state, surface::DrawTarget &target) override;
};

} // namespace oscil::renderer
