#pragma once

/**
@file
@brief The oscilloscope core: sample intake, windowing, scaling and painting entry point.
*/

#include "sample.hpp"
#include "scope_defs.hpp"
#include "scope_state.hpp"

#include <oscil/core/configuration.hpp>

#include <oscil/util/guarded.hpp>

#include <optional>
#include <vector>

// ---------------------------------------------------------------------------------------------------------------------
// Forward declarations

namespace oscil::renderer {
class IScopeRenderer;
} // namespace oscil::renderer

namespace oscil::surface {
struct DrawTarget;
} // namespace oscil::surface

// ---------------------------------------------------------------------------------------------------------------------

namespace oscil::scope {

/// @brief Renders a continuously growing signal on a bounded visible window.
///
/// All state is held behind a single lock. Appends, configuration changes and paints are totally ordered; a paint
/// observes the latest state committed before it acquired the lock.
class Oscilloscope {
public:
    /// @brief Creates an oscilloscope with the default configuration.
    Oscilloscope();

    /// @brief Creates an oscilloscope that follows the given configuration.
    /// @param[in] config the configuration to observe. Observers are unregistered when this object is destroyed
    explicit Oscilloscope(core::Configuration &config);

    Oscilloscope(const Oscilloscope &) = delete;
    Oscilloscope &operator=(const Oscilloscope &) = delete;

    // -------------------------------------------------------------------------
    // Signal

    /// @brief Appends a sample, recomputes the visible window and rebuilds the cached primitive.
    /// @param[in] sample the sample to append
    /// @return `true` if the sample was appended; `false` if it was rejected. Samples with a non-finite time or
    /// amplitude are always rejected. Samples older than the last sample are rejected when out-of-order samples are
    /// rejected
    bool Append(const Sample &sample);

    /// @brief Activates or deactivates the oscilloscope.
    ///
    /// Activating clears the signal, the visible window and the cached primitive. Deactivating leaves all data as is,
    /// so the last frame keeps being painted.
    /// @param[in] enabled whether the oscilloscope is being activated
    void SetActive(bool enabled);

    // -------------------------------------------------------------------------
    // Configuration
    //
    // Invalid values are ignored. Changes apply on the next recompute or paint. Changing the time scale recomputes the
    // visible window right away.

    void SetTimeScaleFactor(float64 value);
    void SetAmpScaleFactor(float64 value);
    void SetAmpTranslation(float64 value);
    void SetStrokeWidth(float32 width);
    void SetStrokeColor(Color color);
    void SetBackgroundColor(std::optional<Color> color);
    void SetHistoryPolicy(HistoryPolicy policy);
    void SetRejectOutOfOrderSamples(bool reject);

    // -------------------------------------------------------------------------
    // Painting

    /// @brief Updates the surface size used by the coordinate transform and rebuilds the cached primitive.
    /// Must be invoked whenever the surface is created or resized.
    /// @param[in] size the new surface size
    void Resize(SurfaceSize size);

    /// @brief Paints one frame with the given renderer while holding the state lock.
    /// @param[in] renderer the renderer to paint with
    /// @param[in] target the target to paint on
    void Paint(renderer::IScopeRenderer &renderer, surface::DrawTarget &target);

private:
    util::Guarded<ScopeState> m_state;

    // Declared after the state so that observers are unregistered before the state is destroyed
    std::vector<util::ObserverHandle> m_configObservers;

    /// @brief Recomputes the visible window, applies the history policy and rebuilds the line strip.
    static void Recompute(ScopeState &state);

public:
    // -------------------------------------------------------------------------
    // Debugger

    /// @brief Read-only view of the oscilloscope state. Every query takes the state lock.
    class Probe {
    public:
        Probe(Oscilloscope &scope);

        /// @brief Number of samples appended since the last reset, including evicted ones.
        size_t GetSampleCount() const;

        /// @brief Number of samples currently held in memory.
        size_t GetRetainedSampleCount() const;

        VisibleWindow GetVisibleWindow() const;
        ScaleState GetScaleState() const;
        PaintStyle GetPaintStyle() const;
        LineStrip GetLineStrip() const;
        HistoryPolicy GetHistoryPolicy() const;
        bool IsRejectingOutOfOrderSamples() const;
        bool IsActive() const;

    private:
        Oscilloscope &m_scope;
    };

    Probe &GetProbe() {
        return m_probe;
    }

    const Probe &GetProbe() const {
        return m_probe;
    }

private:
    Probe m_probe{*this};
};

} // namespace oscil::scope
