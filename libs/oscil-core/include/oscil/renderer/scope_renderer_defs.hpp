#pragma once

#include <string_view>

namespace oscil::renderer {

/// @brief Oscilloscope renderer type enumeration.
enum class ScopeRendererType { Null, Canvas, OpenGL };

/// @brief Retrieves the name of a given renderer type.
/// @param[in] type the renderer type
/// @return a string with the human-readable name of the renderer
inline std::string_view GetRendererName(ScopeRendererType type) {
    switch (type) {
    case ScopeRendererType::Null: return "Null";
    case ScopeRendererType::Canvas: return "Canvas";
    case ScopeRendererType::OpenGL: return "OpenGL";
    default: return "Invalid";
    }
}

// Forward declarations of concrete renderer implementations.
// See the scope_renderer_* headers.

class NullScopeRenderer;
class CanvasScopeRenderer;
class OpenGLScopeRenderer;

namespace detail {

    /// @brief Metadata about renderer types.
    /// @tparam type the renderer type
    template <ScopeRendererType type>
    struct ScopeRendererTypeMeta {};

    /// @brief Metadata about the null renderer.
    template <>
    struct ScopeRendererTypeMeta<ScopeRendererType::Null> {
        using type = NullScopeRenderer;
    };

    /// @brief Metadata about the canvas renderer.
    template <>
    struct ScopeRendererTypeMeta<ScopeRendererType::Canvas> {
        using type = CanvasScopeRenderer;
    };

    /// @brief Metadata about the OpenGL renderer.
    template <>
    struct ScopeRendererTypeMeta<ScopeRendererType::OpenGL> {
        using type = OpenGLScopeRenderer;
    };

    /// @brief Retrieves the class type of the given `ScopeRendererType`.
    /// @tparam type the renderer type
    template <ScopeRendererType type>
    using ScopeRendererType_t = typename ScopeRendererTypeMeta<type>::type;

} // namespace detail

} // namespace oscil::renderer
