#pragma once

#include <oscil/renderer/scope_renderer_base.hpp>

#include <memory>

namespace oscil::renderer {

/// @brief Renderer that uploads the cached line strip to a vertex buffer and draws it with OpenGL.
///
/// GPU resources are created lazily on the first `Render()` call, which must happen on a thread with a current OpenGL
/// 2.0+ context. All subsequent calls, including `ReleaseResources()`, must happen on that same thread.
///
/// If the shader program fails to compile, the renderer becomes invalid: it keeps clearing the background on every frame
/// but never draws the trace.
class OpenGLScopeRenderer : public IScopeRenderer {
public:
    OpenGLScopeRenderer();
    ~OpenGLScopeRenderer();

    bool IsHardwareRenderer() const override {
        return true;
    }

    /// @brief Whether GPU resources were created successfully.
    /// Always `false` before the first frame is rendered.
    bool IsValid() const {
        return m_valid;
    }

    void Render(const scope::ScopeState &state, surface::DrawTarget &target) override;

    /// @brief Destroys all GPU resources. The next `Render()` call recreates them.
    /// Must be invoked on the rendering thread before its OpenGL context is destroyed.
    void ReleaseResources();

private:
    struct Context;
    std::unique_ptr<Context> m_context;

    bool m_initialized = false;
    bool m_valid = false;

    void Initialize();
};

} // namespace oscil::renderer
