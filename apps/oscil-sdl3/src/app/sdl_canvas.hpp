#pragma once

#include <oscil/surface/canvas.hpp>

#include <SDL3/SDL_render.h>

#include <vector>

namespace app {

/// @brief 2D canvas backed by an SDL renderer.
///
/// Lines wider than a pixel are drawn as quads through `SDL_RenderGeometry`. The transform stack only supports
/// translation and axis-aligned scaling.
class SDLCanvas final : public oscil::surface::ICanvas {
public:
    explicit SDLCanvas(SDL_Renderer *renderer);

    oscil::scope::SurfaceSize GetSize() const override;

    void Save() override;
    void Restore() override;

    void Translate(float32 dx, float32 dy) override;
    void Scale(float32 sx, float32 sy) override;

    void Clear(oscil::scope::Color color) override;
    void Fill(oscil::scope::Color color) override;
    void DrawLine(const oscil::scope::LineSegment &segment, const oscil::surface::Stroke &stroke) override;

private:
    struct Transform {
        float32 sx = 1.0f, sy = 1.0f;
        float32 tx = 0.0f, ty = 0.0f;

        SDL_FPoint Apply(float32 x, float32 y) const {
            return {sx * x + tx, sy * y + ty};
        }
    };

    SDL_Renderer *m_renderer;
    Transform m_transform;
    std::vector<Transform> m_stack;
};

} // namespace app
