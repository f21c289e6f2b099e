#include "settings.hpp"

#include "settings_defaults.hpp"

#include <oscil/util/dev_log.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <toml++/toml.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <system_error>

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
        static constexpr std::string_view name = "Settings";
    };

} // namespace grp

// -----------------------------------------------------------------------------
// Enum names

std::string_view ToString(FrontendRenderer renderer) {
    switch (renderer) {
    case FrontendRenderer::Canvas: return "canvas";
    case FrontendRenderer::OpenGL: return "opengl";
    default: return "invalid";
    }
}

std::string_view ToString(Waveform waveform) {
    switch (waveform) {
    case Waveform::Sine: return "sine";
    case Waveform::Square: return "square";
    case Waveform::Noise: return "noise";
    default: return "invalid";
    }
}

std::optional<FrontendRenderer> ParseFrontendRenderer(std::string_view name) {
    if (name == "canvas") {
        return FrontendRenderer::Canvas;
    }
    if (name == "opengl") {
        return FrontendRenderer::OpenGL;
    }
    return std::nullopt;
}

std::optional<Waveform> ParseWaveform(std::string_view name) {
    if (name == "sine") {
        return Waveform::Sine;
    }
    if (name == "square") {
        return Waveform::Square;
    }
    if (name == "noise") {
        return Waveform::Noise;
    }
    return std::nullopt;
}

static std::string_view ToString(scope::HistoryPolicy policy) {
    switch (policy) {
    case scope::HistoryPolicy::Unbounded: return "unbounded";
    case scope::HistoryPolicy::TrimBeforeWindow: return "trim-before-window";
    default: return "invalid";
    }
}

static std::optional<scope::HistoryPolicy> ParseHistoryPolicy(std::string_view name) {
    if (name == "unbounded") {
        return scope::HistoryPolicy::Unbounded;
    }
    if (name == "trim-before-window") {
        return scope::HistoryPolicy::TrimBeforeWindow;
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------------
// TOML helpers

static std::optional<scope::Color> ParseColor(toml::node_view<toml::node> node) {
    const toml::array *arr = node.as_array();
    if (arr == nullptr || arr->size() != 4) {
        return std::nullopt;
    }
    float32 components[4];
    for (size_t i = 0; i < 4; ++i) {
        auto value = (*arr)[i].value<float64>();
        if (!value || *value < 0.0 || *value > 1.0) {
            return std::nullopt;
        }
        components[i] = static_cast<float32>(*value);
    }
    return scope::Color{components[0], components[1], components[2], components[3]};
}

static toml::array ToArray(const scope::Color &color) {
    return toml::array{static_cast<float64>(color.r), static_cast<float64>(color.g), static_cast<float64>(color.b),
                       static_cast<float64>(color.a)};
}

template <typename T, typename TValue>
static void Parse(toml::node_view<toml::node> node, util::Observable<TValue> &value) {
    if (auto parsed = node.value<T>()) {
        value = static_cast<TValue>(*parsed);
    }
}

template <typename TValue>
static void ParseClamped(toml::node_view<toml::node> node, std::string_view key, util::Observable<TValue> &value,
                         TValue min, TValue max) {
    auto parsed = node.value<float64>();
    if (!parsed) {
        return;
    }
    if (!std::isfinite(*parsed)) {
        devlog::warn<grp::base>("Invalid scope.{}; keeping {}", key, value.Get());
        return;
    }
    value = std::clamp(static_cast<TValue>(*parsed), min, max);
}

// -----------------------------------------------------------------------------
// Implementation

Settings::Settings(core::Configuration &config)
    : m_config(config) {
    ResetToDefaults();
}

void Settings::ResetToDefaults() {
    frontend.renderer = FrontendRenderer::Canvas;
    frontend.waveform = Waveform::Sine;
    frontend.sampleRate = config_defaults::generator::kDefaultSampleRate;
    frontend.frequency = config_defaults::generator::kDefaultFrequency;

    auto &cfg = m_config.scope;
    cfg.timeScaleFactor = 4.0;
    cfg.ampScaleFactor = 2.0;
    cfg.ampTranslation = 0.5;
    cfg.strokeWidth = 7.0f;
    cfg.strokeColor = scope::kBlack;
    cfg.backgroundColor = config_defaults::display::kDefaultBackgroundColor;
    cfg.historyPolicy = scope::HistoryPolicy::Unbounded;
    cfg.rejectOutOfOrderSamples = false;
}

SettingsLoadResult Settings::Load(const std::filesystem::path &path) {
    m_path = path;

    std::error_code error{};
    if (!std::filesystem::is_regular_file(path, error)) {
        devlog::info<grp::base>("No settings file at {}; using defaults", path);
        return SettingsLoadResult::Ok();
    }

    toml::table data;
    try {
        data = toml::parse_file(path.string());
    } catch (const toml::parse_error &err) {
        return SettingsLoadResult::Fail(fmt::format("{} (line {}, column {})", err.description(),
                                                    err.source().begin.line, err.source().begin.column));
    }

    if (auto tblScope = data["scope"]) {
        auto &cfg = m_config.scope;
        namespace defaults = config_defaults::scope;
        ParseClamped(tblScope["timeScaleFactor"], "timeScaleFactor", cfg.timeScaleFactor,
                     defaults::kMinTimeScaleFactor, defaults::kMaxTimeScaleFactor);
        ParseClamped(tblScope["ampScaleFactor"], "ampScaleFactor", cfg.ampScaleFactor, defaults::kMinAmpScaleFactor,
                     defaults::kMaxAmpScaleFactor);
        ParseClamped(tblScope["ampTranslation"], "ampTranslation", cfg.ampTranslation,
                     defaults::kMinAmpTranslation, defaults::kMaxAmpTranslation);
        ParseClamped(tblScope["strokeWidth"], "strokeWidth", cfg.strokeWidth, defaults::kMinStrokeWidth,
                     defaults::kMaxStrokeWidth);
        Parse<bool>(tblScope["rejectOutOfOrderSamples"], cfg.rejectOutOfOrderSamples);

        if (auto node = tblScope["strokeColor"]) {
            if (auto color = ParseColor(node)) {
                cfg.strokeColor = *color;
            } else {
                devlog::warn<grp::base>("Invalid scope.strokeColor; expected [r, g, b, a] in [0, 1]");
            }
        }
        if (auto node = tblScope["backgroundColor"]) {
            if (auto color = ParseColor(node)) {
                cfg.backgroundColor = *color;
            } else {
                devlog::warn<grp::base>("Invalid scope.backgroundColor; expected [r, g, b, a] in [0, 1]");
            }
        }
        if (auto name = tblScope["historyPolicy"].value<std::string>()) {
            if (auto policy = ParseHistoryPolicy(*name)) {
                cfg.historyPolicy = *policy;
            } else {
                devlog::warn<grp::base>("Unknown scope.historyPolicy \"{}\"", *name);
            }
        }
    }

    if (auto tblFrontend = data["frontend"]) {
        if (auto name = tblFrontend["renderer"].value<std::string>()) {
            if (auto renderer = ParseFrontendRenderer(*name)) {
                frontend.renderer = *renderer;
            } else {
                devlog::warn<grp::base>("Unknown frontend.renderer \"{}\"", *name);
            }
        }
        if (auto name = tblFrontend["waveform"].value<std::string>()) {
            if (auto waveform = ParseWaveform(*name)) {
                frontend.waveform = *waveform;
            } else {
                devlog::warn<grp::base>("Unknown frontend.waveform \"{}\"", *name);
            }
        }
        if (auto rate = tblFrontend["sampleRate"].value<float64>()) {
            frontend.sampleRate = std::clamp(*rate, config_defaults::generator::kMinSampleRate,
                                             config_defaults::generator::kMaxSampleRate);
        }
        if (auto freq = tblFrontend["frequency"].value<float64>()) {
            frontend.frequency = std::clamp(*freq, config_defaults::generator::kMinFrequency,
                                            config_defaults::generator::kMaxFrequency);
        }
    }

    devlog::info<grp::base>("Settings loaded from {}", path);
    return SettingsLoadResult::Ok();
}

SettingsSaveResult Settings::Save() const {
    if (m_path.empty()) {
        return SettingsSaveResult::Fail("No settings file path");
    }

    const auto &cfg = m_config.scope;

    toml::table tblScope{
        {"timeScaleFactor", cfg.timeScaleFactor.Get()},
        {"ampScaleFactor", cfg.ampScaleFactor.Get()},
        {"ampTranslation", cfg.ampTranslation.Get()},
        {"strokeWidth", static_cast<float64>(cfg.strokeWidth.Get())},
        {"strokeColor", ToArray(cfg.strokeColor.Get())},
        {"historyPolicy", ToString(cfg.historyPolicy.Get())},
        {"rejectOutOfOrderSamples", cfg.rejectOutOfOrderSamples.Get()},
    };
    if (const auto &bg = cfg.backgroundColor.Get()) {
        tblScope.insert("backgroundColor", ToArray(*bg));
    }

    toml::table tblFrontend{
        {"renderer", ToString(frontend.renderer)},
        {"waveform", ToString(frontend.waveform)},
        {"sampleRate", frontend.sampleRate},
        {"frequency", frontend.frequency},
    };

    toml::table data{
        {"scope", std::move(tblScope)},
        {"frontend", std::move(tblFrontend)},
    };

    std::error_code error{};
    if (m_path.has_parent_path()) {
        std::filesystem::create_directories(m_path.parent_path(), error);
        if (error) {
            return SettingsSaveResult::Fail(fmt::format("Could not create {}: {}", m_path.parent_path(), error.message()));
        }
    }

    std::ofstream out{m_path, std::ios::binary | std::ios::trunc};
    if (!out) {
        return SettingsSaveResult::Fail(fmt::format("Could not open {} for writing", m_path));
    }
    out << data << '\n';
    if (!out) {
        return SettingsSaveResult::Fail(fmt::format("Could not write {}", m_path));
    }

    devlog::debug<grp::base>("Settings saved to {}", m_path);
    return SettingsSaveResult::Ok();
}

} // namespace app
