#include <oscil/render/frame_painter.hpp>

namespace oscil::render {

FramePainter::FramePainter(scope::Oscilloscope &scope, renderer::IScopeRenderer &renderer)
    : m_scope(scope)
    , m_renderer(renderer) {}

void FramePainter::OnSurfaceReady(scope::SurfaceSize size) {
    m_scope.Resize(size);
    m_attached.store(true, std::memory_order_release);
}

void FramePainter::OnSurfaceResized(scope::SurfaceSize size) {
    m_scope.Resize(size);
}

void FramePainter::OnSurfaceDestroyed() {
    m_attached.store(false, std::memory_order_release);
}

void FramePainter::Release() {
    m_attached.store(false, std::memory_order_release);
}

bool FramePainter::PaintFrame(surface::DrawTarget &target) {
    if (!m_attached.load(std::memory_order_acquire)) {
        return false;
    }
    m_scope.Paint(m_renderer, target);
    return true;
}

} // namespace oscil::render
