#pragma once

/**
@file
@brief Common definitions shared by the oscilloscope core and its renderers.
*/

#include <oscil/core/types.hpp>

#include <optional>
#include <string_view>

namespace oscil::scope {

/// @brief An RGBA color with normalized float components.
struct Color {
    float32 r = 0.0f;
    float32 g = 0.0f;
    float32 b = 0.0f;
    float32 a = 1.0f;

    bool operator==(const Color &) const = default;
};

inline constexpr Color kBlack{0.0f, 0.0f, 0.0f, 1.0f};
inline constexpr Color kTransparent{0.0f, 0.0f, 0.0f, 0.0f};

/// @brief Dimensions of a drawing surface in pixels.
struct SurfaceSize {
    uint32 width = 0;
    uint32 height = 0;

    bool operator==(const SurfaceSize &) const = default;

    bool IsEmpty() const {
        return width == 0 || height == 0;
    }
};

/// @brief Stroke and background settings applied uniformly to the whole trace.
struct PaintStyle {
    float32 strokeWidth = 7.0f;
    Color strokeColor = kBlack;
    std::optional<Color> backgroundColor; ///< Background fill. If unset, the surface is cleared to transparent.
};

/// @brief Sample history retention policy.
enum class HistoryPolicy {
    Unbounded,        ///< Keep every sample ever appended
    TrimBeforeWindow, ///< Drop samples that precede the visible window
};

inline std::string_view GetHistoryPolicyName(HistoryPolicy policy) {
    switch (policy) {
    case HistoryPolicy::Unbounded: return "Unbounded";
    case HistoryPolicy::TrimBeforeWindow: return "TrimBeforeWindow";
    default: return "Invalid";
    }
}

} // namespace oscil::scope
