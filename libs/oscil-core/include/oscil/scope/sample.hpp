#pragma once

#include <oscil/core/types.hpp>

namespace oscil::scope {

/// @brief A single point of the signal: a timestamp in seconds and a caller-defined amplitude.
struct Sample {
    float64 time = 0.0;
    float64 amplitude = 0.0;

    bool operator==(const Sample &) const = default;
};

} // namespace oscil::scope
