#pragma once

/**
@file
@brief Drawing surface and surface lifecycle abstractions.
*/

#include "canvas.hpp"

#include <oscil/scope/scope_defs.hpp>

#include <optional>

namespace oscil::surface {

/// @brief A target acquired from a surface for the duration of a single frame.
///
/// Canvas-based surfaces provide a canvas. Hardware surfaces leave `canvas` null and expect the caller to draw with
/// the graphics context that is current on the painting thread.
struct DrawTarget {
    ICanvas *canvas = nullptr;
    scope::SurfaceSize size{};
};

/// @brief A surface that can be drawn on one frame at a time.
class ISurface {
public:
    virtual ~ISurface() = default;

    /// @brief Acquires a target for the next frame.
    /// @return the draw target, or `std::nullopt` if the surface is temporarily unavailable
    virtual std::optional<DrawTarget> AcquireDrawTarget() = 0;

    /// @brief Presents a frame previously acquired with `AcquireDrawTarget()`.
    /// Must be invoked exactly once for every acquired target, even if painting failed.
    virtual void Present(DrawTarget &target) = 0;
};

/// @brief Receives surface lifecycle notifications.
///
/// Notifications are delivered in order: `OnSurfaceReady`, any number of `OnSurfaceResized`, then
/// `OnSurfaceDestroyed`. A surface can be recreated afterwards, starting the sequence over.
class ISurfaceListener {
public:
    virtual ~ISurfaceListener() = default;

    virtual void OnSurfaceReady(scope::SurfaceSize size) = 0;
    virtual void OnSurfaceResized(scope::SurfaceSize size) = 0;

    /// @brief Invoked before the surface is torn down. No drawing may happen on the surface once this returns.
    virtual void OnSurfaceDestroyed() = 0;
};

} // namespace oscil::surface
