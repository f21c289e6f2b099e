#pragma once

#include <oscil/core/configuration.hpp>
#include <oscil/core/types.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace app {

/// @brief Frontend renderer selection.
enum class FrontendRenderer { Canvas, OpenGL };

/// @brief Waveforms produced by the demo signal generator.
enum class Waveform { Sine, Square, Noise };

std::string_view ToString(FrontendRenderer renderer);
std::string_view ToString(Waveform waveform);

std::optional<FrontendRenderer> ParseFrontendRenderer(std::string_view name);
std::optional<Waveform> ParseWaveform(std::string_view name);

struct SettingsLoadResult {
    bool succeeded;
    std::string errorMessage;

    [[nodiscard]] constexpr operator bool() const noexcept {
        return succeeded;
    }

    static SettingsLoadResult Ok() {
        return {.succeeded = true};
    }

    static SettingsLoadResult Fail(const std::string &message) {
        return {.succeeded = false, .errorMessage = message};
    }
};

struct SettingsSaveResult {
    bool succeeded;
    std::string errorMessage;

    [[nodiscard]] constexpr operator bool() const noexcept {
        return succeeded;
    }

    static SettingsSaveResult Ok() {
        return {.succeeded = true};
    }

    static SettingsSaveResult Fail(const std::string &message) {
        return {.succeeded = false, .errorMessage = message};
    }
};

/// @brief Persistent frontend settings, stored as a TOML document.
///
/// The `[scope]` table is mapped onto the core configuration; assigning it notifies every observer. The `[frontend]`
/// table holds settings that only the demo application uses.
struct Settings {
    explicit Settings(oscil::core::Configuration &config);

    struct Frontend {
        FrontendRenderer renderer = FrontendRenderer::Canvas;
        Waveform waveform = Waveform::Sine;
        float64 sampleRate;
        float64 frequency;
    } frontend;

    /// @brief Restores every setting to its default value.
    void ResetToDefaults();

    /// @brief Loads settings from the given file. A missing file is not an error; defaults are kept.
    /// @param[in] path the path to the settings file
    /// @return the result of the operation
    SettingsLoadResult Load(const std::filesystem::path &path);

    /// @brief Saves settings to the file last passed to `Load()`.
    /// @return the result of the operation
    SettingsSaveResult Save() const;

    const std::filesystem::path &GetPath() const {
        return m_path;
    }

private:
    oscil::core::Configuration &m_config;
    std::filesystem::path m_path;
};

} // namespace app
