#include "app.hpp"

#include "sdl_canvas.hpp"
#include "sdl_gl_surface.hpp"
#include "settings_defaults.hpp"
#include "signal_generator.hpp"

#include <oscil/render/frame_painter.hpp>
#include <oscil/render/paint_loop.hpp>
#include <oscil/renderer/scope_renderer_canvas.hpp>
#include <oscil/renderer/scope_renderer_gl.hpp>
#include <oscil/version.hpp>

#include <oscil/util/dev_log.hpp>
#include <oscil/util/scope_guard.hpp>

#include <SDL3/SDL_init.h>

#include <fmt/format.h>

#include <algorithm>

using namespace oscil;

namespace app {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // base
    //   input

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "App";
    };

    struct input : public base {
        static constexpr std::string_view name = "App-Input";
    };

} // namespace grp

static constexpr const char *kSettingsFileName = "oscil.toml";

App::App()
    : m_settings(m_config) {}

App::~App() {
    DestroySurface();
}

int App::Run(const CommandLineOptions &options) {
    devlog::info<grp::base>("Oscil {}", version::fullstring);

    if (auto result = m_settings.Load(options.profilePath / kSettingsFileName); !result) {
        devlog::warn<grp::base>("Could not load settings: {}", result.errorMessage);
    }
    ApplyCommandLineOptions(options);

    if (!SDL_Init(SDL_INIT_VIDEO)) {
        devlog::error<grp::base>("Could not initialize SDL: {}", SDL_GetError());
        return 1;
    }
    util::ScopeGuard sgQuit{[&] {
        DestroySurface();
        SDL_Quit();
    }};

    const bool useOpenGL = m_settings.frontend.renderer == FrontendRenderer::OpenGL;
    if (auto result = useOpenGL ? CreateGLSurface() : CreateCanvasSurface(); !result) {
        devlog::error<grp::base>("Could not create {} surface: {}", ToString(m_settings.frontend.renderer),
                                 result.errorMessage);
        return 1;
    }

    scope::Oscilloscope scope{m_config};
    SignalGenerator generator{scope, m_settings.frontend.waveform, m_settings.frontend.sampleRate,
                              m_settings.frontend.frequency};

    m_running = true;
    m_active = true;
    generator.Start();

    if (useOpenGL) {
        RunOpenGL(scope, generator);
    } else {
        RunCanvas(scope, generator);
    }

    generator.Stop();
    devlog::info<grp::base>("Produced {} samples", generator.GetSampleCount());

    if (auto result = m_settings.Save(); !result) {
        devlog::warn<grp::base>("Could not save settings: {}", result.errorMessage);
    }
    return 0;
}

void App::ApplyCommandLineOptions(const CommandLineOptions &options) {
    if (options.renderer) {
        if (auto renderer = ParseFrontendRenderer(*options.renderer)) {
            m_settings.frontend.renderer = *renderer;
        } else {
            devlog::warn<grp::base>("Unknown renderer \"{}\"; keeping {}", *options.renderer,
                                    ToString(m_settings.frontend.renderer));
        }
    }
    if (options.waveform) {
        if (auto waveform = ParseWaveform(*options.waveform)) {
            m_settings.frontend.waveform = *waveform;
        } else {
            devlog::warn<grp::base>("Unknown waveform \"{}\"; keeping {}", *options.waveform,
                                    ToString(m_settings.frontend.waveform));
        }
    }
    if (options.sampleRate) {
        m_settings.frontend.sampleRate = std::clamp(*options.sampleRate, config_defaults::generator::kMinSampleRate,
                                                    config_defaults::generator::kMaxSampleRate);
    }
}

// -----------------------------------------------------------------------------
// Surface setup

SurfaceSetupResult App::CreateCanvasSurface() {
    m_window = SDL_CreateWindow("Oscil", config_defaults::window::kDefaultWidth,
                                config_defaults::window::kDefaultHeight, SDL_WINDOW_RESIZABLE);
    if (m_window == nullptr) {
        return SurfaceSetupResult::Fail(fmt::format("Could not create window: {}", SDL_GetError()));
    }

    m_renderer = SDL_CreateRenderer(m_window, nullptr);
    if (m_renderer == nullptr) {
        return SurfaceSetupResult::Fail(fmt::format("Could not create renderer: {}", SDL_GetError()));
    }
    if (!SDL_SetRenderVSync(m_renderer, 1)) {
        devlog::debug<grp::base>("VSync unavailable: {}", SDL_GetError());
    }

    return SurfaceSetupResult::Ok();
}

SurfaceSetupResult App::CreateGLSurface() {
    // RGBA8888 with a 16-bit depth buffer and no stencil
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 2);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_RED_SIZE, 8);
    SDL_GL_SetAttribute(SDL_GL_GREEN_SIZE, 8);
    SDL_GL_SetAttribute(SDL_GL_BLUE_SIZE, 8);
    SDL_GL_SetAttribute(SDL_GL_ALPHA_SIZE, 8);
    SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 16);
    SDL_GL_SetAttribute(SDL_GL_STENCIL_SIZE, 0);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    m_window = SDL_CreateWindow("Oscil", config_defaults::window::kDefaultWidth,
                                config_defaults::window::kDefaultHeight, SDL_WINDOW_RESIZABLE | SDL_WINDOW_OPENGL);
    if (m_window == nullptr) {
        return SurfaceSetupResult::Fail(fmt::format("Could not create window: {}", SDL_GetError()));
    }

    m_glContext = SDL_GL_CreateContext(m_window);
    if (m_glContext == nullptr) {
        return SurfaceSetupResult::Fail(fmt::format("Could not create OpenGL context: {}", SDL_GetError()));
    }

    // The context is made current on the paint loop thread
    if (!SDL_GL_MakeCurrent(m_window, nullptr)) {
        return SurfaceSetupResult::Fail(fmt::format("Could not release OpenGL context: {}", SDL_GetError()));
    }

    return SurfaceSetupResult::Ok();
}

void App::DestroySurface() {
    if (m_glContext != nullptr) {
        SDL_GL_DestroyContext(m_glContext);
        m_glContext = nullptr;
    }
    if (m_renderer != nullptr) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window != nullptr) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
}

scope::SurfaceSize App::GetWindowPixelSize() const {
    int width = 0;
    int height = 0;
    if (!SDL_GetWindowSizeInPixels(m_window, &width, &height)) {
        devlog::warn<grp::base>("Could not get window size: {}", SDL_GetError());
        return {};
    }
    return {static_cast<uint32>(width), static_cast<uint32>(height)};
}

// -----------------------------------------------------------------------------
// Main loops

void App::RunCanvas(scope::Oscilloscope &scope, SignalGenerator &generator) {
    SDLCanvas canvas{m_renderer};
    renderer::CanvasScopeRenderer scopeRenderer{};
    render::FramePainter painter{scope, scopeRenderer};

    painter.OnSurfaceReady(GetWindowPixelSize());

    SDL_Event evt{};
    while (m_running) {
        while (SDL_PollEvent(&evt)) {
            if (auto size = HandleEvent(evt, scope, generator)) {
                painter.OnSurfaceResized(*size);
            }
        }

        surface::DrawTarget target{.canvas = &canvas, .size = canvas.GetSize()};
        if (painter.PaintFrame(target)) {
            SDL_RenderPresent(m_renderer);
        }
    }

    painter.OnSurfaceDestroyed();
}

void App::RunOpenGL(scope::Oscilloscope &scope, SignalGenerator &generator) {
    SDLGLSurface surface{m_window, m_glContext};
    renderer::OpenGLScopeRenderer scopeRenderer{};
    render::PaintLoop loop{scope, scopeRenderer, surface};

    struct LoopContext {
        SDLGLSurface &surface;
        renderer::IScopeRenderer &renderer;
    } loopCtx{surface, scopeRenderer};

    // Resources are created and destroyed on the loop thread, which owns the context while running
    loop.Callbacks.ThreadStarted = {&loopCtx, [](void *ctx) {
                                        auto &context = *static_cast<LoopContext *>(ctx);
                                        context.surface.MakeCurrent();
                                    }};
    loop.Callbacks.ThreadExiting = {&loopCtx, [](void *ctx) {
                                        auto &context = *static_cast<LoopContext *>(ctx);
                                        if (auto *glRenderer = context.renderer.As<renderer::ScopeRendererType::OpenGL>()) {
                                            glRenderer->ReleaseResources();
                                        }
                                        context.surface.ReleaseCurrent();
                                    }};

    const scope::SurfaceSize size = GetWindowPixelSize();
    surface.SetSize(size);
    loop.OnSurfaceReady(size);

    SDL_Event evt{};
    while (m_running) {
        if (!SDL_WaitEventTimeout(&evt, 100)) {
            continue;
        }
        do {
            if (auto newSize = HandleEvent(evt, scope, generator)) {
                surface.SetSize(*newSize);
                loop.OnSurfaceResized(*newSize);
            }
        } while (SDL_PollEvent(&evt));
    }

    loop.OnSurfaceDestroyed();
    loop.Release();
    devlog::info<grp::base>("Painted {} frames; {} iterations without a target", loop.GetFrameCount(),
                            loop.GetMissedTargetCount());
}

// -----------------------------------------------------------------------------
// Events

std::optional<scope::SurfaceSize> App::HandleEvent(const SDL_Event &evt, scope::Oscilloscope &scope,
                                                   SignalGenerator &generator) {
    switch (evt.type) {
    case SDL_EVENT_QUIT:
    case SDL_EVENT_WINDOW_CLOSE_REQUESTED: m_running = false; break;
    case SDL_EVENT_KEY_DOWN:
        if (!evt.key.repeat || evt.key.key != SDLK_SPACE) {
            HandleKeyDown(evt.key.key, scope, generator);
        }
        break;
    case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
        return scope::SurfaceSize{static_cast<uint32>(evt.window.data1), static_cast<uint32>(evt.window.data2)};
    case SDL_EVENT_WINDOW_MINIMIZED: return scope::SurfaceSize{};
    case SDL_EVENT_WINDOW_RESTORED: return GetWindowPixelSize();
    default: break;
    }
    return std::nullopt;
}

void App::HandleKeyDown(SDL_Keycode key, scope::Oscilloscope &scope, SignalGenerator &generator) {
    namespace defaults = config_defaults::scope;
    auto &cfg = m_config.scope;

    switch (key) {
    case SDLK_ESCAPE: m_running = false; break;
    case SDLK_SPACE:
        m_active = !m_active;
        if (m_active) {
            scope.SetActive(true);
            generator.Restart();
        } else {
            generator.Stop();
            scope.SetActive(false);
        }
        devlog::info<grp::input>("Oscilloscope {}", m_active ? "activated" : "deactivated");
        break;
    case SDLK_UP:
        cfg.ampTranslation = std::min(cfg.ampTranslation.Get() + defaults::kAmpTranslationStep,
                                      defaults::kMaxAmpTranslation);
        break;
    case SDLK_DOWN:
        cfg.ampTranslation = std::max(cfg.ampTranslation.Get() - defaults::kAmpTranslationStep,
                                      defaults::kMinAmpTranslation);
        break;
    case SDLK_EQUALS:
    case SDLK_PLUS:
    case SDLK_KP_PLUS:
        cfg.timeScaleFactor = std::min(cfg.timeScaleFactor.Get() + defaults::kTimeScaleFactorStep,
                                       defaults::kMaxTimeScaleFactor);
        devlog::debug<grp::input>("Time scale factor: {} s", cfg.timeScaleFactor.Get());
        break;
    case SDLK_MINUS:
    case SDLK_KP_MINUS:
        cfg.timeScaleFactor = std::max(cfg.timeScaleFactor.Get() - defaults::kTimeScaleFactorStep,
                                       defaults::kMinTimeScaleFactor);
        devlog::debug<grp::input>("Time scale factor: {} s", cfg.timeScaleFactor.Get());
        break;
    default: break;
    }
}

} // namespace app
