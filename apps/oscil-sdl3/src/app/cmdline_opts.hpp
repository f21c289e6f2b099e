#pragma once

#include <oscil/core/types.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace app {

struct CommandLineOptions {
    std::filesystem::path profilePath;
    std::optional<std::string> renderer;
    std::optional<std::string> waveform;
    std::optional<float64> sampleRate;
};

} // namespace app
