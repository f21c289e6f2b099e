#pragma once

/**
@file
@brief Observable runtime configuration.
*/

#include <oscil/scope/scope_defs.hpp>

#include <oscil/util/observable.hpp>

#include <optional>

namespace oscil::core {

/// @brief Runtime configuration for the oscilloscope core.
///
/// Components observe the values they care about. Assigning a value notifies the observers on the calling thread.
/// Observers are unregistered when the observing component is destroyed.
struct Configuration {
    struct Scope {
        /// @brief Seconds spanned by the full horizontal extent of the surface.
        util::Observable<float64> timeScaleFactor{4.0};

        /// @brief Amplitude units spanned by the full vertical extent of the surface.
        util::Observable<float64> ampScaleFactor{2.0};

        /// @brief Vertical offset of the trace, in normalized amplitude units.
        util::Observable<float64> ampTranslation{0.5};

        /// @brief Trace width in pixels.
        util::Observable<float32> strokeWidth{7.0f};

        /// @brief Trace color.
        util::Observable<scope::Color> strokeColor{scope::kBlack};

        /// @brief Background color. If unset, the surface is cleared to transparent.
        util::Observable<std::optional<scope::Color>> backgroundColor{std::nullopt};

        /// @brief Sample history retention policy.
        util::Observable<scope::HistoryPolicy> historyPolicy{scope::HistoryPolicy::Unbounded};

        /// @brief Reject samples with a timestamp older than the last appended sample.
        util::Observable<bool> rejectOutOfOrderSamples{false};
    } scope;
};

} // namespace oscil::core
