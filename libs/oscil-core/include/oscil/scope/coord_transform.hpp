#pragma once

/**
@file
@brief Scale state and sample-to-surface coordinate transforms.
*/

#include "scope_defs.hpp"
#include "signal.hpp"
#include "visible_window.hpp"

#include <oscil/util/inline.hpp>

namespace oscil::scope {

/// @brief Scale factors relating signal units to surface pixels.
///
/// `timeInPx` and `ampInPx` are derived from the scale factors and the surface size. Every mutator refreshes them, so
/// they are never stale after a resize.
class ScaleState {
public:
    ScaleState() {
        Refresh();
    }

    void SetTimeScaleFactor(float64 value) {
        m_timeScaleFactor = value;
        Refresh();
    }

    void SetAmpScaleFactor(float64 value) {
        m_ampScaleFactor = value;
        Refresh();
    }

    void SetAmpTranslation(float64 value) {
        m_ampTranslation = value;
    }

    /// @brief Updates the surface size and refreshes the per-pixel factors.
    /// @param[in] size the new surface size
    void Resize(SurfaceSize size) {
        m_size = size;
        Refresh();
    }

    /// @brief Seconds spanned by the full horizontal extent of the surface.
    float64 TimeScaleFactor() const {
        return m_timeScaleFactor;
    }

    /// @brief Amplitude units spanned by the full vertical extent of the surface.
    float64 AmpScaleFactor() const {
        return m_ampScaleFactor;
    }

    /// @brief Vertical offset, in normalized amplitude units.
    float64 AmpTranslation() const {
        return m_ampTranslation;
    }

    SurfaceSize Size() const {
        return m_size;
    }

    /// @brief Seconds per pixel along the X axis. Zero while the surface is empty.
    float64 TimeInPx() const {
        return m_timeInPx;
    }

    /// @brief Amplitude units per pixel along the Y axis. Zero while the surface is empty.
    float64 AmpInPx() const {
        return m_ampInPx;
    }

    /// @brief Whether the transform can be applied, i.e. the surface has a non-zero area.
    bool IsValid() const {
        return !m_size.IsEmpty();
    }

private:
    float64 m_timeScaleFactor = 4.0;
    float64 m_ampScaleFactor = 2.0;
    float64 m_ampTranslation = 0.5;
    SurfaceSize m_size{};

    float64 m_timeInPx = 0.0;
    float64 m_ampInPx = 0.0;

    void Refresh();
};

// -----------------------------------------------------------------------------
// Transforms
//
// All transforms require a valid scale state and an index within the visible window.

/// @brief Maps an amplitude to [0, 1] relative to the window's amplitude extremes.
/// A flat window (zero range) is treated as having a range of 1.
FORCE_INLINE float64 NormalizeAmp(float64 amplitude, const VisibleWindow &window) {
    const float64 range = window.ampRange == 0.0 ? 1.0 : window.ampRange;
    return (amplitude - window.minAmp) / range;
}

/// @brief Computes the horizontal pixel coordinate of the sample at `index`.
FORCE_INLINE float64 TimeToPx(const Signal &signal, const VisibleWindow &window, const ScaleState &scale,
                              size_t index) {
    const float64 time = signal[index].time - signal.First().time;
    return (time - window.timeTranslation) / scale.TimeInPx();
}

/// @brief Computes the vertical pixel coordinate of the sample at `index`, with Y increasing upwards.
FORCE_INLINE float64 AmpToPx(const Signal &signal, const VisibleWindow &window, const ScaleState &scale,
                             size_t index) {
    return (NormalizeAmp(signal[index].amplitude, window) + scale.AmpTranslation()) / scale.AmpInPx();
}

/// @brief Maps the center of a pixel column to the [-1, 1] clip-space range.
FORCE_INLINE float32 PxToPlaneX(float64 px, uint32 width) {
    return static_cast<float32>(2.0 * (px + 0.5) / width - 1.0);
}

/// @brief Maps the center of a pixel row to the [-1, 1] clip-space range.
FORCE_INLINE float32 PxToPlaneY(float64 px, uint32 height) {
    return static_cast<float32>(2.0 * (px + 0.5) / height - 1.0);
}

} // namespace oscil::scope
