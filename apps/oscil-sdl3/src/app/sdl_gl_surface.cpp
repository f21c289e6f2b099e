#include "sdl_gl_surface.hpp"

#include <oscil/util/dev_log.hpp>

using namespace oscil;

namespace app {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // base

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "SDL-GLSurface";
    };

} // namespace grp

SDLGLSurface::SDLGLSurface(SDL_Window *window, SDL_GLContext context)
    : m_window(window)
    , m_context(context) {}

bool SDLGLSurface::MakeCurrent() {
    if (!SDL_GL_MakeCurrent(m_window, m_context)) {
        devlog::error<grp::base>("Could not make OpenGL context current: {}", SDL_GetError());
        return false;
    }
    if (!SDL_GL_SetSwapInterval(1)) {
        devlog::debug<grp::base>("VSync unavailable: {}", SDL_GetError());
    }
    return true;
}

void SDLGLSurface::ReleaseCurrent() {
    if (!SDL_GL_MakeCurrent(m_window, nullptr)) {
        devlog::warn<grp::base>("Could not release OpenGL context: {}", SDL_GetError());
    }
}

void SDLGLSurface::SetSize(scope::SurfaceSize size) {
    m_width.store(size.width, std::memory_order_release);
    m_height.store(size.height, std::memory_order_release);
}

std::optional<surface::DrawTarget> SDLGLSurface::AcquireDrawTarget() {
    const scope::SurfaceSize size{m_width.load(std::memory_order_acquire), m_height.load(std::memory_order_acquire)};
    if (size.IsEmpty() || SDL_GL_GetCurrentContext() != m_context) {
        return std::nullopt;
    }
    return surface::DrawTarget{.canvas = nullptr, .size = size};
}

void SDLGLSurface::Present(surface::DrawTarget &) {
    if (!SDL_GL_SwapWindow(m_window)) {
        devlog::warn<grp::base>("Could not swap window: {}", SDL_GetError());
    }
}

} // namespace app
