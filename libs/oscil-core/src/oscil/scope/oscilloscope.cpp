#include <oscil/scope/oscilloscope.hpp>

#include <oscil/renderer/scope_renderer_base.hpp>
#include <oscil/surface/surface.hpp>

#include <oscil/util/dev_log.hpp>

#include <cmath>

namespace oscil::scope {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // base
    //   config

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Scope";
    };

    struct config : public base {
        static constexpr std::string_view name = "Scope-Config";
    };

} // namespace grp

// -----------------------------------------------------------------------------
// Implementation

Oscilloscope::Oscilloscope() = default;

Oscilloscope::Oscilloscope(core::Configuration &config) {
    auto &cfg = config.scope;
    m_configObservers.push_back(cfg.timeScaleFactor.Observe([&](float64 value) { SetTimeScaleFactor(value); }));
    m_configObservers.push_back(cfg.ampScaleFactor.Observe([&](float64 value) { SetAmpScaleFactor(value); }));
    m_configObservers.push_back(cfg.ampTranslation.Observe([&](float64 value) { SetAmpTranslation(value); }));
    m_configObservers.push_back(cfg.strokeWidth.Observe([&](float32 value) { SetStrokeWidth(value); }));
    m_configObservers.push_back(cfg.strokeColor.Observe([&](const Color &value) { SetStrokeColor(value); }));
    m_configObservers.push_back(
        cfg.backgroundColor.Observe([&](const std::optional<Color> &value) { SetBackgroundColor(value); }));
    m_configObservers.push_back(cfg.historyPolicy.Observe([&](HistoryPolicy value) { SetHistoryPolicy(value); }));
    m_configObservers.push_back(
        cfg.rejectOutOfOrderSamples.Observe([&](bool value) { SetRejectOutOfOrderSamples(value); }));
}

bool Oscilloscope::Append(const Sample &sample) {
    if (!std::isfinite(sample.time) || !std::isfinite(sample.amplitude)) {
        devlog::warn<grp::base>("Rejected non-finite sample ({}s, {})", sample.time, sample.amplitude);
        return false;
    }

    auto state = m_state.Lock();
    if (state->rejectOutOfOrderSamples && !state->signal.IsEmpty() && sample.time < state->signal.Last().time) {
        devlog::warn<grp::base>("Rejected out-of-order sample at {}s; last sample is at {}s", sample.time,
                                state->signal.Last().time);
        return false;
    }

    state->signal.Append(sample);
    Recompute(*state);
    return true;
}

void Oscilloscope::SetActive(bool enabled) {
    auto state = m_state.Lock();
    state->active = enabled;
    if (enabled) {
        state->signal.Clear();
        state->window = {};
        state->lineStrip.Clear();
        state->windowRescalePending = false;
        devlog::debug<grp::base>("Activated; signal cleared");
    } else {
        devlog::debug<grp::base>("Deactivated");
    }
}

void Oscilloscope::SetTimeScaleFactor(float64 value) {
    if (!std::isfinite(value) || value <= 0.0) {
        devlog::warn<grp::config>("Ignoring invalid time scale factor {}", value);
        return;
    }
    auto state = m_state.Lock();
    state->scale.SetTimeScaleFactor(value);
    state->windowRescalePending = true;
    if (!state->signal.IsEmpty()) {
        Recompute(*state);
    }
}

void Oscilloscope::SetAmpScaleFactor(float64 value) {
    if (!std::isfinite(value) || value <= 0.0) {
        devlog::warn<grp::config>("Ignoring invalid amplitude scale factor {}", value);
        return;
    }
    auto state = m_state.Lock();
    state->scale.SetAmpScaleFactor(value);
    BuildLineStrip(state->signal, state->window, state->scale, state->lineStrip);
}

void Oscilloscope::SetAmpTranslation(float64 value) {
    if (!std::isfinite(value)) {
        devlog::warn<grp::config>("Ignoring invalid amplitude translation {}", value);
        return;
    }
    auto state = m_state.Lock();
    state->scale.SetAmpTranslation(value);
    BuildLineStrip(state->signal, state->window, state->scale, state->lineStrip);
}

void Oscilloscope::SetStrokeWidth(float32 width) {
    if (!std::isfinite(width) || width < 0.0f) {
        devlog::warn<grp::config>("Ignoring invalid stroke width {}", width);
        return;
    }
    m_state.Lock()->style.strokeWidth = width;
}

void Oscilloscope::SetStrokeColor(Color color) {
    m_state.Lock()->style.strokeColor = color;
}

void Oscilloscope::SetBackgroundColor(std::optional<Color> color) {
    m_state.Lock()->style.backgroundColor = color;
}

void Oscilloscope::SetHistoryPolicy(HistoryPolicy policy) {
    m_state.Lock()->historyPolicy = policy;
    devlog::debug<grp::config>("History policy set to {}", GetHistoryPolicyName(policy));
}

void Oscilloscope::SetRejectOutOfOrderSamples(bool reject) {
    m_state.Lock()->rejectOutOfOrderSamples = reject;
}

void Oscilloscope::Resize(SurfaceSize size) {
    auto state = m_state.Lock();
    state->scale.Resize(size);
    BuildLineStrip(state->signal, state->window, state->scale, state->lineStrip);
    devlog::debug<grp::base>("Surface resized to {}x{}", size.width, size.height);
}

void Oscilloscope::Paint(renderer::IScopeRenderer &renderer, surface::DrawTarget &target) {
    auto state = m_state.Lock();
    renderer.Render(*state, target);
}

void Oscilloscope::Recompute(ScopeState &state) {
    VisibleWindow previous = state.window;
    if (state.windowRescalePending) {
        previous.beginIndex = state.signal.BaseIndex();
        previous.timeTranslation = 0.0;
        state.windowRescalePending = false;
    }

    state.window = SelectWindow(state.signal, state.scale.TimeScaleFactor(), previous);
    if (state.historyPolicy == HistoryPolicy::TrimBeforeWindow) {
        state.signal.EvictBefore(state.window.beginIndex);
    }
    BuildLineStrip(state.signal, state.window, state.scale, state.lineStrip);
}

// -----------------------------------------------------------------------------
// Probe implementation

Oscilloscope::Probe::Probe(Oscilloscope &scope)
    : m_scope(scope) {}

size_t Oscilloscope::Probe::GetSampleCount() const {
    return m_scope.m_state.Lock()->signal.Size();
}

size_t Oscilloscope::Probe::GetRetainedSampleCount() const {
    return m_scope.m_state.Lock()->signal.RetainedCount();
}

VisibleWindow Oscilloscope::Probe::GetVisibleWindow() const {
    return m_scope.m_state.Lock()->window;
}

ScaleState Oscilloscope::Probe::GetScaleState() const {
    return m_scope.m_state.Lock()->scale;
}

PaintStyle Oscilloscope::Probe::GetPaintStyle() const {
    return m_scope.m_state.Lock()->style;
}

LineStrip Oscilloscope::Probe::GetLineStrip() const {
    return m_scope.m_state.Lock()->lineStrip;
}

HistoryPolicy Oscilloscope::Probe::GetHistoryPolicy() const {
    return m_scope.m_state.Lock()->historyPolicy;
}

bool Oscilloscope::Probe::IsRejectingOutOfOrderSamples() const {
    return m_scope.m_state.Lock()->rejectOutOfOrderSamples;
}

bool Oscilloscope::Probe::IsActive() const {
    return m_scope.m_state.Lock()->active;
}

} // namespace oscil::scope
