#pragma once

#include <oscil/scope/scope_defs.hpp>

#include <oscil/core/types.hpp>

namespace app::config_defaults {

namespace scope {
    inline constexpr float64 kMinTimeScaleFactor = 0.5;
    inline constexpr float64 kMaxTimeScaleFactor = 60.0;
    inline constexpr float64 kTimeScaleFactorStep = 0.5;

    inline constexpr float64 kMinAmpScaleFactor = 0.01;
    inline constexpr float64 kMaxAmpScaleFactor = 1000.0;

    inline constexpr float32 kMinStrokeWidth = 0.0f;
    inline constexpr float32 kMaxStrokeWidth = 64.0f;

    inline constexpr float64 kMinAmpTranslation = -2.0;
    inline constexpr float64 kMaxAmpTranslation = 2.0;
    inline constexpr float64 kAmpTranslationStep = 0.05;
} // namespace scope

namespace display {
    // The window is opaque, so the frontend paints a background by default
    inline constexpr oscil::scope::Color kDefaultBackgroundColor{1.0f, 1.0f, 1.0f, 1.0f};
} // namespace display

namespace generator {
    inline constexpr float64 kMinSampleRate = 1.0;
    inline constexpr float64 kMaxSampleRate = 20000.0;
    inline constexpr float64 kDefaultSampleRate = 200.0;

    inline constexpr float64 kMinFrequency = 0.01;
    inline constexpr float64 kMaxFrequency = 1000.0;
    inline constexpr float64 kDefaultFrequency = 0.5;
} // namespace generator

namespace window {
    inline constexpr int kDefaultWidth = 960;
    inline constexpr int kDefaultHeight = 540;
} // namespace window

} // namespace app::config_defaults
