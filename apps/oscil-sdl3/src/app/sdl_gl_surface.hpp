#pragma once

#include <oscil/surface/surface.hpp>

#include <SDL3/SDL_video.h>

#include <atomic>

namespace app {

/// @brief Surface that presents by swapping the buffers of an SDL window with an OpenGL context.
///
/// The pixel size is pushed by the main thread, since window queries are not allowed from the painting thread.
/// Frames are unavailable while the size is empty, e.g. when the window is minimized.
class SDLGLSurface final : public oscil::surface::ISurface {
public:
    SDLGLSurface(SDL_Window *window, SDL_GLContext context);

    /// @brief Makes the OpenGL context current on the calling thread.
    bool MakeCurrent();

    /// @brief Detaches the OpenGL context from the calling thread.
    void ReleaseCurrent();

    void SetSize(oscil::scope::SurfaceSize size);

    std::optional<oscil::surface::DrawTarget> AcquireDrawTarget() override;
    void Present(oscil::surface::DrawTarget &target) override;

private:
    SDL_Window *m_window;
    SDL_GLContext m_context;

    std::atomic<uint32> m_width{0};
    std::atomic<uint32> m_height{0};
};

} // namespace app
