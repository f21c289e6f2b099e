#pragma once

/**
@file
@brief Append-only signal sample store.
*/

#include "sample.hpp"

#include <deque>

namespace oscil::scope {

/// @brief Ordered, append-only sequence of samples.
///
/// Samples are addressed by logical index: the first sample ever appended has index 0 and every appended sample gets
/// the next index. Samples may be evicted from the front with `EvictBefore()` without changing the logical indices of
/// the remaining samples, the logical size or the first sample.
///
/// This class does not synchronize access. Callers serialize all reads and writes.
class Signal {
public:
    /// @brief Appends a sample to the end of the signal.
    /// @param[in] sample the sample to append
    void Append(const Sample &sample);

    /// @brief Removes all samples and resets logical indexing.
    void Clear();

    /// @brief Drops all retained samples with a logical index lower than `index`.
    /// @param[in] index the logical index of the oldest sample to retain
    void EvictBefore(size_t index);

    /// @brief Retrieves a sample by logical index.
    /// The index must be in the range [`BaseIndex()`, `LastIndex()`].
    const Sample &Get(size_t index) const {
        return m_samples[index - m_baseIndex];
    }

    const Sample &operator[](size_t index) const {
        return Get(index);
    }

    /// @brief Retrieves the first sample ever appended since the last `Clear()`, even if it has been evicted.
    const Sample &First() const {
        return m_first;
    }

    const Sample &Last() const {
        return m_samples.back();
    }

    /// @brief The number of samples appended since the last `Clear()`, including evicted samples.
    size_t Size() const {
        return m_baseIndex + m_samples.size();
    }

    bool IsEmpty() const {
        return Size() == 0;
    }

    /// @brief The logical index of the last sample. Only meaningful if the signal is not empty.
    size_t LastIndex() const {
        return Size() - 1;
    }

    /// @brief The logical index of the oldest retained sample.
    size_t BaseIndex() const {
        return m_baseIndex;
    }

    /// @brief The number of samples currently held in memory.
    size_t RetainedCount() const {
        return m_samples.size();
    }

private:
    std::deque<Sample> m_samples;
    Sample m_first{};
    size_t m_baseIndex = 0;
};

} // namespace oscil::scope
