#include "sdl_canvas.hpp"

#include <oscil/util/dev_log.hpp>

#include <array>
#include <cmath>

using namespace oscil;

namespace app {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // base

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "SDL-Canvas";
    };

} // namespace grp

static SDL_FColor ToSDL(const scope::Color &color) {
    return {color.r, color.g, color.b, color.a};
}

SDLCanvas::SDLCanvas(SDL_Renderer *renderer)
    : m_renderer(renderer) {}

scope::SurfaceSize SDLCanvas::GetSize() const {
    int width = 0;
    int height = 0;
    if (!SDL_GetCurrentRenderOutputSize(m_renderer, &width, &height)) {
        devlog::warn<grp::base>("Could not get render output size: {}", SDL_GetError());
        return {};
    }
    return {static_cast<uint32>(width), static_cast<uint32>(height)};
}

void SDLCanvas::Save() {
    m_stack.push_back(m_transform);
}

void SDLCanvas::Restore() {
    if (m_stack.empty()) {
        devlog::warn<grp::base>("Restore without matching Save");
        return;
    }
    m_transform = m_stack.back();
    m_stack.pop_back();
}

void SDLCanvas::Translate(float32 dx, float32 dy) {
    m_transform.tx += m_transform.sx * dx;
    m_transform.ty += m_transform.sy * dy;
}

void SDLCanvas::Scale(float32 sx, float32 sy) {
    m_transform.sx *= sx;
    m_transform.sy *= sy;
}

void SDLCanvas::Clear(scope::Color color) {
    SDL_SetRenderDrawBlendMode(m_renderer, SDL_BLENDMODE_NONE);
    SDL_SetRenderDrawColorFloat(m_renderer, color.r, color.g, color.b, color.a);
    SDL_RenderClear(m_renderer);
}

void SDLCanvas::Fill(scope::Color color) {
    SDL_SetRenderDrawBlendMode(m_renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColorFloat(m_renderer, color.r, color.g, color.b, color.a);
    SDL_RenderFillRect(m_renderer, nullptr);
}

void SDLCanvas::DrawLine(const scope::LineSegment &segment, const surface::Stroke &stroke) {
    const SDL_FPoint p0 = m_transform.Apply(segment.x0, segment.y0);
    const SDL_FPoint p1 = m_transform.Apply(segment.x1, segment.y1);

    SDL_SetRenderDrawBlendMode(m_renderer, SDL_BLENDMODE_BLEND);

    const float32 dx = p1.x - p0.x;
    const float32 dy = p1.y - p0.y;
    const float32 length = std::sqrt(dx * dx + dy * dy);
    if (stroke.width <= 1.0f || length == 0.0f) {
        SDL_SetRenderDrawColorFloat(m_renderer, stroke.color.r, stroke.color.g, stroke.color.b, stroke.color.a);
        SDL_RenderLine(m_renderer, p0.x, p0.y, p1.x, p1.y);
        return;
    }

    // Expand the segment into a quad along its normal
    const float32 halfWidth = stroke.width * 0.5f;
    const float32 nx = -dy / length * halfWidth;
    const float32 ny = dx / length * halfWidth;

    const SDL_FColor color = ToSDL(stroke.color);
    const std::array<SDL_Vertex, 4> vertices{{
        {.position = {p0.x + nx, p0.y + ny}, .color = color, .tex_coord = {0.0f, 0.0f}},
        {.position = {p0.x - nx, p0.y - ny}, .color = color, .tex_coord = {0.0f, 0.0f}},
        {.position = {p1.x + nx, p1.y + ny}, .color = color, .tex_coord = {0.0f, 0.0f}},
        {.position = {p1.x - nx, p1.y - ny}, .color = color, .tex_coord = {0.0f, 0.0f}},
    }};
    static constexpr std::array<int, 6> kIndices{0, 1, 2, 2, 1, 3};

    if (!SDL_RenderGeometry(m_renderer, nullptr, vertices.data(), static_cast<int>(vertices.size()), kIndices.data(),
                            static_cast<int>(kIndices.size()))) {
        devlog::warn<grp::base>("Could not draw line: {}", SDL_GetError());
    }
}

} // namespace app
