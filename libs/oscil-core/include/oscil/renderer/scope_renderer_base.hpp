#pragma once

#include "scope_renderer_defs.hpp"

#include <oscil/scope/scope_state.hpp>
#include <oscil/surface/surface.hpp>

#include <oscil/util/inline.hpp>

namespace oscil::renderer {

/// @brief Interface for oscilloscope trace renderers.
///
/// `Render()` is invoked with the oscilloscope state lock held. Implementations must not retain references to the
/// state past the call.
class IScopeRenderer {
public:
    IScopeRenderer(ScopeRendererType type)
        : m_type(type) {}

    virtual ~IScopeRenderer() = default;

    // If this renderer object has the specified ScopeRendererType, casts it to the corresponding concrete type.
    // Returns nullptr otherwise.
    template <ScopeRendererType type>
    FORCE_INLINE typename detail::ScopeRendererType_t<type> *As() {
        if (m_type == type) {
            return static_cast<detail::ScopeRendererType_t<type> *>(this);
        } else {
            return nullptr;
        }
    }

    // If this renderer object has the specified ScopeRendererType, casts it to the corresponding concrete type.
    // Returns nullptr otherwise.
    template <ScopeRendererType type>
    FORCE_INLINE const typename detail::ScopeRendererType_t<type> *As() const {
        if (m_type == type) {
            return static_cast<const detail::ScopeRendererType_t<type> *>(this);
        } else {
            return nullptr;
        }
    }

    std::string_view GetName() const {
        return GetRendererName(m_type);
    }

    ScopeRendererType GetType() const {
        return m_type;
    }

    /// @brief Whether this renderer draws through a graphics API rather than a canvas.
    virtual bool IsHardwareRenderer() const {
        return false;
    }

    /// @brief Draws one frame of the given state onto the target.
    /// @param[in] state the oscilloscope state, locked for the duration of the call
    /// @param[in] target the frame target
    virtual void Render(const scope::ScopeState &state, surface::DrawTarget &target) = 0;

private:
    const ScopeRendererType m_type;
};

} // namespace oscil::renderer
