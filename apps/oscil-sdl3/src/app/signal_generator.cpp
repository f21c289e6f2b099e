#include "signal_generator.hpp"

#include <oscil/util/dev_log.hpp>

#include <chrono>
#include <cmath>
#include <numbers>
#include <random>

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
        static constexpr std::string_view name = "Generator";
    };

} // namespace grp

SignalGenerator::SignalGenerator(scope::Oscilloscope &scope, Waveform waveform, float64 sampleRate,
                                 float64 frequency)
    : m_scope(scope)
    , m_waveform(waveform)
    , m_sampleRate(sampleRate)
    , m_frequency(frequency) {}

SignalGenerator::~SignalGenerator() {
    Stop();
}

void SignalGenerator::Start() {
    if (m_thread.joinable()) {
        return;
    }
    m_thread = std::jthread{[this](std::stop_token stopToken) { Run(stopToken); }};
    devlog::info<grp::base>("Generating {} wave at {} Hz, sampled at {} Hz", ToString(m_waveform), m_frequency,
                            m_sampleRate);
}

void SignalGenerator::Stop() {
    if (m_thread.joinable()) {
        m_thread.request_stop();
        m_thread.join();
    }
}

void SignalGenerator::Restart() {
    Stop();
    Start();
}

void SignalGenerator::Run(std::stop_token stopToken) {
    using clock = std::chrono::steady_clock;

    std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<float64> noise{-1.0, 1.0};

    auto generate = [&](float64 time) -> float64 {
        const float64 phase = time * m_frequency;
        switch (m_waveform) {
        case Waveform::Sine: return std::sin(2.0 * std::numbers::pi * phase);
        case Waveform::Square: return phase - std::floor(phase) < 0.5 ? 1.0 : -1.0;
        case Waveform::Noise: return noise(rng);
        default: return 0.0;
        }
    };

    const std::chrono::duration<float64> period{1.0 / m_sampleRate};
    const auto start = clock::now();
    uint64 index = 0;

    while (!stopToken.stop_requested()) {
        const float64 time = static_cast<float64>(index) / m_sampleRate;
        if (m_scope.Append({.time = time, .amplitude = generate(time)})) {
            m_sampleCount.fetch_add(1, std::memory_order_acq_rel);
        } else {
            devlog::warn<grp::base>("Sample at {}s rejected", time);
        }
        ++index;

        std::this_thread::sleep_until(start + std::chrono::duration_cast<clock::duration>(period * index));
    }
}

} // namespace app
