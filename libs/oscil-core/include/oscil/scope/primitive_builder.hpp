#pragma once

/**
@file
@brief Builders that turn the visible window into drawable primitives.
*/

#include "coord_transform.hpp"
#include "signal.hpp"
#include "visible_window.hpp"

#include <oscil/core/types.hpp>

#include <concepts>
#include <vector>

namespace oscil::scope {

/// @brief A line strip in clip-space coordinates, ready to be uploaded to a vertex buffer.
struct LineStrip {
    /// @brief Interleaved X/Y pairs, one pair per visible sample, in increasing index order.
    std::vector<float32> vertices;

    /// @brief Number of vertices submitted to the line strip draw call.
    ///
    /// This is `endIndex - beginIndex`, which is one less than the number of points in `vertices`; the last point of
    /// the window is never drawn by the GPU renderer.
    uint32 lineCount = 0;

    void Clear() {
        vertices.clear();
        lineCount = 0;
    }

    size_t PointCount() const {
        return vertices.size() / 2;
    }

    size_t SizeInBytes() const {
        return vertices.size() * sizeof(float32);
    }
};

/// @brief A single line segment in pixel coordinates, Y increasing upwards.
struct LineSegment {
    float32 x0, y0;
    float32 x1, y1;
};

/// @brief Rebuilds the line strip for the visible window from scratch.
///
/// The output is cleared if the signal is empty or the scale state is not valid. Existing storage in `out` is reused.
/// Only samples within [`window.beginIndex`, `window.endIndex`] are read.
///
/// @param[in] signal the signal
/// @param[in] window the visible window computed for `signal`
/// @param[in] scale the current scale state
/// @param[out] out the line strip to rebuild
void BuildLineStrip(const Signal &signal, const VisibleWindow &window, const ScaleState &scale, LineStrip &out);

/// @brief Invokes `fn` with each pair of consecutive visible samples, transformed to pixel coordinates.
///
/// Nothing is emitted unless the signal holds more than one sample and the scale state is valid.
/// Only samples within [`window.beginIndex`, `window.endIndex`] are read.
///
/// @tparam Fn the type of the segment consumer
/// @param[in] signal the signal
/// @param[in] window the visible window computed for `signal`
/// @param[in] scale the current scale state
/// @param[in] fn the function invoked with every `LineSegment`
template <typename Fn>
    requires std::invocable<Fn, const LineSegment &>
void ForEachSegment(const Signal &signal, const VisibleWindow &window, const ScaleState &scale, Fn &&fn) {
    if (signal.Size() <= 1 || !scale.IsValid()) {
        return;
    }

    float32 x = static_cast<float32>(TimeToPx(signal, window, scale, window.beginIndex));
    float32 y = static_cast<float32>(AmpToPx(signal, window, scale, window.beginIndex));
    for (size_t i = window.beginIndex + 1; i <= window.endIndex; ++i) {
        const LineSegment segment{
            .x0 = x,
            .y0 = y,
            .x1 = static_cast<float32>(TimeToPx(signal, window, scale, i)),
            .y1 = static_cast<float32>(AmpToPx(signal, window, scale, i)),
        };
        fn(segment);
        x = segment.x1;
        y = segment.y1;
    }
}

} // namespace oscil::scope
