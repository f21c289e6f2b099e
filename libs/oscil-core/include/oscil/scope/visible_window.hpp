#pragma once

/**
@file
@brief Visible window selection.
*/

#include "signal.hpp"

#include <oscil/core/types.hpp>

namespace oscil::scope {

/// @brief The contiguous range of samples currently on screen and their amplitude extremes.
///
/// `beginIndex` and `endIndex` are inclusive logical indices into the `Signal`.
struct VisibleWindow {
    size_t beginIndex = 0;
    size_t endIndex = 0;
    float64 timeTranslation = 0.0; ///< Time-axis origin shift in seconds, relative to the first sample
    float64 minAmp = 0.0;
    float64 maxAmp = 0.0;
    float64 ampRange = 0.0; ///< `maxAmp - minAmp`; zero for flat or single-sample windows

    bool operator==(const VisibleWindow &) const = default;

    /// @brief The number of samples in the window, assuming the signal is not empty.
    size_t PointCount() const {
        return endIndex - beginIndex + 1;
    }

    /// @brief Whether the window holds fewer than two points, leaving nothing to draw.
    bool IsDegenerate() const {
        return beginIndex == endIndex;
    }
};

/// @brief Computes the visible window after the signal has changed.
///
/// Once the signal spans more than `timeScaleFactor` seconds, the first visible sample is estimated from the mean
/// sample period of the whole signal instead of searching the timestamps. Until then, `beginIndex` and
/// `timeTranslation` are carried over from `previous`. `beginIndex` never moves below `previous.beginIndex` or below
/// the oldest retained sample, and never past the last sample. When either bound pushes `beginIndex` past the
/// estimate, `timeTranslation` is raised so that the first visible sample sits on the left edge. If the estimate
/// cannot be computed (non-finite timestamps), the previous window start is kept.
///
/// The amplitude extremes are computed over exactly [`beginIndex`, `endIndex`].
///
/// @param[in] signal the signal. If empty, a default window is returned
/// @param[in] timeScaleFactor the visible time span in seconds. Must be positive
/// @param[in] previous the window computed for the previous state of the signal
/// @return the new visible window
VisibleWindow SelectWindow(const Signal &signal, float64 timeScaleFactor, const VisibleWindow &previous);

} // namespace oscil::scope
