#pragma once

#include <oscil/renderer/scope_renderer_base.hpp>

#include <oscil/core/types.hpp>

#include <atomic>

namespace oscil::renderer {

/// @brief Renderer that draws nothing. Counts rendered frames.
class NullScopeRenderer : public IScopeRenderer {
public:
    NullScopeRenderer();

    void Render(const scope::ScopeState &state, surface::DrawTarget &target) override;

    uint64 GetFrameCount() const {
        return m_frameCount.load(std::memory_order_acquire);
    }

private:
    std::atomic<uint64> m_frameCount{0};
};

} // namespace oscil::renderer
