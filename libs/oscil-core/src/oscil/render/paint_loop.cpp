#include <oscil/render/paint_loop.hpp>

#include <oscil/util/dev_log.hpp>
#include <oscil/util/scope_guard.hpp>

#include <optional>

namespace oscil::render {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // base
    //   frame

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "PaintLoop";
    };

    struct frame : public base {
        static constexpr devlog::Level level = devlog::level::trace;
        static constexpr std::string_view name = "PaintLoop-Frame";
    };

} // namespace grp

PaintLoop::PaintLoop(scope::Oscilloscope &scope, renderer::IScopeRenderer &renderer, surface::ISurface &surface)
    : m_scope(scope)
    , m_renderer(renderer)
    , m_surface(surface) {}

PaintLoop::~PaintLoop() {
    Release();
}

void PaintLoop::OnSurfaceReady(scope::SurfaceSize size) {
    std::unique_lock lock{m_mtxLifecycle};
    const PaintLoopState state = m_state.load(std::memory_order_acquire);
    if (state == PaintLoopState::Destroyed) {
        devlog::warn<grp::base>("Surface ready after release; ignored");
        return;
    }
    if (state == PaintLoopState::Running) {
        // Surface recreated without a destroy notification
        StopLocked();
    }

    m_scope.Resize(size);
    m_state.store(PaintLoopState::Running, std::memory_order_release);
    m_thread = std::jthread{[this](std::stop_token stopToken) { Run(stopToken); }};
    devlog::info<grp::base>("Started with {} renderer on a {}x{} surface", m_renderer.GetName(), size.width,
                            size.height);
}

void PaintLoop::OnSurfaceResized(scope::SurfaceSize size) {
    m_scope.Resize(size);
}

void PaintLoop::OnSurfaceDestroyed() {
    std::unique_lock lock{m_mtxLifecycle};
    if (m_state.load(std::memory_order_acquire) != PaintLoopState::Running) {
        return;
    }
    StopLocked();
}

void PaintLoop::Release() {
    std::unique_lock lock{m_mtxLifecycle};
    if (m_state.load(std::memory_order_acquire) == PaintLoopState::Destroyed) {
        return;
    }
    StopLocked();
    m_state.store(PaintLoopState::Destroyed, std::memory_order_release);
    devlog::debug<grp::base>("Released after {} frames", m_frameCount.load());
}

void PaintLoop::StopLocked() {
    if (m_thread.joinable()) {
        m_thread.request_stop();
        m_thread.join();
        m_state.store(PaintLoopState::Cancelled, std::memory_order_release);
        devlog::info<grp::base>("Stopped");
    }
}

void PaintLoop::Run(std::stop_token stopToken) {
    Callbacks.ThreadStarted();
    util::ScopeGuard sgExit{[&] { Callbacks.ThreadExiting(); }};

    while (!stopToken.stop_requested()) {
        std::optional<surface::DrawTarget> target = m_surface.AcquireDrawTarget();
        if (!target) {
            m_missedTargetCount.fetch_add(1, std::memory_order_acq_rel);
            devlog::trace<grp::frame>("Draw target unavailable; retrying");
            std::this_thread::yield();
            continue;
        }

        util::ScopeGuard sgPresent{[&] { m_surface.Present(*target); }};
        m_scope.Paint(m_renderer, *target);
        m_frameCount.fetch_add(1, std::memory_order_acq_rel);
    }
}

} // namespace oscil::render
