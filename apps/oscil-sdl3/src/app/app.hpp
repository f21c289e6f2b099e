#pragma once

#include "cmdline_opts.hpp"
#include "settings.hpp"

#include <oscil/core/configuration.hpp>
#include <oscil/scope/oscilloscope.hpp>
#include <oscil/surface/surface.hpp>

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <optional>
#include <string>

namespace app {

class SignalGenerator;

/// @brief Result of creating the window and its drawing backend.
struct SurfaceSetupResult {
    bool succeeded;
    std::string errorMessage;

    [[nodiscard]] constexpr operator bool() const noexcept {
        return succeeded;
    }

    static SurfaceSetupResult Ok() {
        return {.succeeded = true};
    }

    static SurfaceSetupResult Fail(const std::string &message) {
        return {.succeeded = false, .errorMessage = message};
    }
};

class App {
public:
    App();
    ~App();

    int Run(const CommandLineOptions &options);

private:
    oscil::core::Configuration m_config;
    Settings m_settings;

    SDL_Window *m_window = nullptr;
    SDL_Renderer *m_renderer = nullptr;
    SDL_GLContext m_glContext = nullptr;

    bool m_running = false;
    bool m_active = true;

    void ApplyCommandLineOptions(const CommandLineOptions &options);

    SurfaceSetupResult CreateCanvasSurface();
    SurfaceSetupResult CreateGLSurface();
    void DestroySurface();

    void RunCanvas(oscil::scope::Oscilloscope &scope, SignalGenerator &generator);
    void RunOpenGL(oscil::scope::Oscilloscope &scope, SignalGenerator &generator);

    oscil::scope::SurfaceSize GetWindowPixelSize() const;

    /// @brief Handles input and window events common to both renderers.
    /// @return the new surface size if the window was resized
    std::optional<oscil::scope::SurfaceSize> HandleEvent(const SDL_Event &evt, oscil::scope::Oscilloscope &scope,
                                                         SignalGenerator &generator);
    void HandleKeyDown(SDL_Keycode key, oscil::scope::Oscilloscope &scope, SignalGenerator &generator);
};

} // namespace app
