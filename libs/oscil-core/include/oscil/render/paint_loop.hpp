#pragma once

/**
@file
@brief Self-driven paint loop running on a dedicated thread while a surface is alive.
*/

#include <oscil/renderer/scope_renderer_base.hpp>
#include <oscil/scope/oscilloscope.hpp>
#include <oscil/surface/surface.hpp>

#include <oscil/core/types.hpp>

#include <oscil/util/callback.hpp>

#include <atomic>
#include <mutex>
#include <stop_token>
#include <string_view>
#include <thread>

namespace oscil::render {

/// @brief Paint loop lifecycle states.
enum class PaintLoopState {
    Created,   ///< Surface not ready yet; no thread running
    Running,   ///< Loop thread painting back-to-back
    Cancelled, ///< Loop thread stopped and joined; can be restarted by a new surface
    Destroyed, ///< Loop released for good
};

inline std::string_view GetPaintLoopStateName(PaintLoopState state) {
    switch (state) {
    case PaintLoopState::Created: return "Created";
    case PaintLoopState::Running: return "Running";
    case PaintLoopState::Cancelled: return "Cancelled";
    case PaintLoopState::Destroyed: return "Destroyed";
    default: return "Invalid";
    }
}

/// @brief Type of callback invoked on the loop thread before the first frame.
/// Can be used to make a graphics context current on the loop thread.
using CBLoopThreadStarted = util::OptionalCallback<void()>;

/// @brief Type of callback invoked on the loop thread after the last frame.
/// Can be used to release graphics resources and the graphics context.
using CBLoopThreadExiting = util::OptionalCallback<void()>;

/// @brief Callbacks invoked by the paint loop thread.
struct PaintLoopCallbacks {
    CBLoopThreadStarted ThreadStarted;
    CBLoopThreadExiting ThreadExiting;
};

/// @brief Repeatedly acquires a draw target, paints the oscilloscope and presents, with no fixed frame rate.
///
/// The loop starts when the surface reports it is ready and stops when the surface reports it is being destroyed.
/// `OnSurfaceDestroyed()` and `Release()` block until the loop thread has exited, so no painting happens once they
/// return.
///
/// Lifecycle notifications must come from a single controlling thread.
class PaintLoop : public surface::ISurfaceListener {
public:
    PaintLoop(scope::Oscilloscope &scope, renderer::IScopeRenderer &renderer, surface::ISurface &surface);
    ~PaintLoop();

    PaintLoop(const PaintLoop &) = delete;
    PaintLoop &operator=(const PaintLoop &) = delete;

    // -------------------------------------------------------------------------
    // Configuration

    /// @brief Loop thread callbacks. Must be set before the loop starts.
    PaintLoopCallbacks Callbacks;

    // -------------------------------------------------------------------------
    // Surface lifecycle

    void OnSurfaceReady(scope::SurfaceSize size) override;
    void OnSurfaceResized(scope::SurfaceSize size) override;
    void OnSurfaceDestroyed() override;

    /// @brief Stops the loop for good. Further surface notifications are ignored.
    void Release();

    // -------------------------------------------------------------------------
    // Status

    PaintLoopState GetState() const {
        return m_state.load(std::memory_order_acquire);
    }

    /// @brief Number of frames painted and presented since construction.
    uint64 GetFrameCount() const {
        return m_frameCount.load(std::memory_order_acquire);
    }

    /// @brief Number of loop iterations that found no draw target available.
    uint64 GetMissedTargetCount() const {
        return m_missedTargetCount.load(std::memory_order_acquire);
    }

private:
    scope::Oscilloscope &m_scope;
    renderer::IScopeRenderer &m_renderer;
    surface::ISurface &m_surface;

    std::mutex m_mtxLifecycle;
    std::jthread m_thread;
    std::atomic<PaintLoopState> m_state{PaintLoopState::Created};

    std::atomic<uint64> m_frameCount{0};
    std::atomic<uint64> m_missedTargetCount{0};

    void Run(std::stop_token stopToken);

    // Requests the loop thread to stop and waits until it exits. Requires m_mtxLifecycle to be held.
    void StopLocked();
};

} // namespace oscil::render
