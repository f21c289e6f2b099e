#pragma once

/**
@file
@brief Externally-driven painter invoked once per host paint callback.
*/

#include <oscil/renderer/scope_renderer_base.hpp>
#include <oscil/scope/oscilloscope.hpp>
#include <oscil/surface/surface.hpp>

#include <atomic>

namespace oscil::render {

/// @brief Paints the oscilloscope whenever the host asks for a frame.
///
/// The host owns the painting thread and the frame pacing. Frames requested while no surface is attached are skipped.
class FramePainter : public surface::ISurfaceListener {
public:
    FramePainter(scope::Oscilloscope &scope, renderer::IScopeRenderer &renderer);

    void OnSurfaceReady(scope::SurfaceSize size) override;
    void OnSurfaceResized(scope::SurfaceSize size) override;
    void OnSurfaceDestroyed() override;

    /// @brief Detaches from the surface. Subsequent frames are skipped until the next `OnSurfaceReady()`.
    void Release();

    /// @brief Paints one frame on the target provided by the host's paint callback.
    /// @param[in] target the frame target
    /// @return `true` if a frame was painted, `false` if no surface is attached
    bool PaintFrame(surface::DrawTarget &target);

    bool IsAttached() const {
        return m_attached.load(std::memory_order_acquire);
    }

private:
    scope::Oscilloscope &m_scope;
    renderer::IScopeRenderer &m_renderer;

    std::atomic_bool m_attached{false};
};

} // namespace oscil::render
