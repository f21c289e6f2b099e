#include <oscil/scope/visible_window.hpp>

#include <oscil/util/dev_log.hpp>

#include <algorithm>
#include <cmath>

namespace oscil::scope {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // window

    struct window {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Scope-Window";
    };

} // namespace grp

VisibleWindow SelectWindow(const Signal &signal, float64 timeScaleFactor, const VisibleWindow &previous) {
    if (signal.IsEmpty()) {
        return {};
    }

    VisibleWindow window{};
    window.beginIndex = previous.beginIndex;
    window.timeTranslation = previous.timeTranslation;

    const size_t lastIndex = signal.LastIndex();
    const float64 signalTime = signal.Last().time - signal.First().time;
    const float64 subTime = signalTime - timeScaleFactor;
    bool estimated = false;
    size_t index = 0;
    if (subTime > 0.0) {
        // Assume uniform sampling over the whole signal
        const float64 meanPeriod = signalTime / static_cast<float64>(signal.Size());
        const float64 estimate = std::floor(subTime / meanPeriod) - 1.0;
        if (std::isfinite(estimate)) {
            index = estimate < 0.0 ? 0 : static_cast<size_t>(std::min(estimate, static_cast<float64>(lastIndex)));
            estimated = true;

            window.timeTranslation = subTime;
            window.beginIndex = std::max(index, previous.beginIndex);
        } else {
            devlog::warn<grp::window>("Cannot estimate window start over {}s; keeping previous window", signalTime);
        }
    }
    window.beginIndex = std::clamp(window.beginIndex, signal.BaseIndex(), lastIndex);
    window.endIndex = lastIndex;

    if (estimated && window.beginIndex > index) {
        // The first visible sample is later than the estimate; keep it on the left edge instead of leaving a gap
        const float64 beginTime = signal[window.beginIndex].time - signal.First().time;
        window.timeTranslation = std::max(window.timeTranslation, beginTime);
    }

    float64 min = signal[window.beginIndex].amplitude;
    float64 max = min;
    for (size_t i = window.beginIndex + 1; i <= window.endIndex; ++i) {
        const float64 amp = signal[i].amplitude;
        min = std::min(min, amp);
        max = std::max(max, amp);
    }
    window.minAmp = min;
    window.maxAmp = max;
    window.ampRange = max - min;

    devlog::trace<grp::window>("Window [{}..{}] shift={:.4f}s amp=[{:.4f}..{:.4f}]", window.beginIndex,
                               window.endIndex, window.timeTranslation, window.minAmp, window.maxAmp);

    return window;
}

} // namespace oscil::scope
