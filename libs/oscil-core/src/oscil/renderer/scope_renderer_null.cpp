#include <oscil/renderer/scope_renderer_null.hpp>

namespace oscil::renderer {

NullScopeRenderer::NullScopeRenderer()
    : IScopeRenderer(ScopeRendererType::Null) {}

void NullScopeRenderer::Render(const scope::ScopeState &, surface::DrawTarget &) {
    m_frameCount.fetch_add(1, std::memory_order_acq_rel);
}

} // namespace oscil::renderer
