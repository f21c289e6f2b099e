#pragma once

#include "settings.hpp"

#include <oscil/scope/oscilloscope.hpp>

#include <oscil/core/types.hpp>

#include <atomic>
#include <stop_token>
#include <thread>

namespace app {

/// @brief Produces samples of a periodic or random waveform on a dedicated thread and appends them to an oscilloscope.
///
/// Samples are timestamped at exact multiples of the sample period, measured from the moment the generator started,
/// and are paced in real time.
class SignalGenerator {
public:
    SignalGenerator(oscil::scope::Oscilloscope &scope, Waveform waveform, float64 sampleRate,
                    float64 frequency);
    ~SignalGenerator();

    void Start();
    void Stop();

    /// @brief Restarts the sample clock at zero.
    /// Must be used after the oscilloscope is reset so that timestamps start over with the new session.
    void Restart();

    uint64 GetSampleCount() const {
        return m_sampleCount.load(std::memory_order_acquire);
    }

private:
    oscil::scope::Oscilloscope &m_scope;
    const Waveform m_waveform;
    const float64 m_sampleRate;
    const float64 m_frequency;

    std::jthread m_thread;
    std::atomic<uint64> m_sampleCount{0};

    void Run(std::stop_token stopToken);
};

} // namespace app
