#pragma once

#include "coord_transform.hpp"
#include "primitive_builder.hpp"
#include "scope_defs.hpp"
#include "signal.hpp"
#include "visible_window.hpp"

namespace oscil::scope {

/// @brief All mutable oscilloscope state.
///
/// Owned by `Oscilloscope` behind a single lock. Renderers receive a const reference while the lock is held.
struct ScopeState {
    Signal signal;
    VisibleWindow window;
    ScaleState scale;
    LineStrip lineStrip; ///< Cached GPU primitive, rebuilt on every update
    PaintStyle style;

    HistoryPolicy historyPolicy = HistoryPolicy::Unbounded;
    bool rejectOutOfOrderSamples = false;
    bool active = true;

    /// @brief Set when the time scale changes; the next window selection starts over from the oldest retained sample.
    bool windowRescalePending = false;
};

} // namespace oscil::scope
