#pragma once

/**
@file
@brief 2D drawing canvas abstraction used by the canvas renderer.
*/

#include <oscil/scope/primitive_builder.hpp>
#include <oscil/scope/scope_defs.hpp>

namespace oscil::surface {

/// @brief Stroke parameters for line drawing.
struct Stroke {
    float32 width = 1.0f;
    scope::Color color = scope::kBlack;
};

/// @brief Immediate-mode 2D canvas.
///
/// Implementations keep a transform stack. `Save()` pushes the current transform and `Restore()` pops it. All drawing
/// coordinates are transformed by the current transform before rasterization.
class ICanvas {
public:
    virtual ~ICanvas() = default;

    /// @brief Retrieves the size of the canvas in pixels.
    virtual scope::SurfaceSize GetSize() const = 0;

    virtual void Save() = 0;
    virtual void Restore() = 0;

    virtual void Translate(float32 dx, float32 dy) = 0;
    virtual void Scale(float32 sx, float32 sy) = 0;

    /// @brief Replaces every pixel of the canvas with the given color, ignoring blending.
    virtual void Clear(scope::Color color) = 0;

    /// @brief Blends the given color over the whole canvas.
    virtual void Fill(scope::Color color) = 0;

    /// @brief Draws a single line segment with the given stroke.
    virtual void DrawLine(const scope::LineSegment &segment, const Stroke &stroke) = 0;
};

} // namespace oscil::surface
