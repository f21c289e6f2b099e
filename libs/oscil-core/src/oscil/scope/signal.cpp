#include <oscil/scope/signal.hpp>

#include <algorithm>

namespace oscil::scope {

void Signal::Append(const Sample &sample) {
    if (IsEmpty()) {
        m_first = sample;
    }
    m_samples.push_back(sample);
}

void Signal::Clear() {
    m_samples.clear();
    m_first = {};
    m_baseIndex = 0;
}

void Signal::EvictBefore(size_t index) {
    if (IsEmpty()) {
        return;
    }
    // Always keep the last sample so that the signal never becomes empty through eviction
    index = std::min(index, LastIndex());
    if (index <= m_baseIndex) {
        return;
    }
    const size_t count = index - m_baseIndex;
    m_samples.erase(m_samples.begin(), m_samples.begin() + count);
    m_baseIndex = index;
}

} // namespace oscil::scope
