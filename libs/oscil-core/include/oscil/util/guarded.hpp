#pragma once

/**
@file
@brief Exclusive-access wrapper around a value.
*/

#include <mutex>
#include <utility>

namespace util {

/// @brief Owns a value and a mutex that protects it.
///
/// The value can only be reached through a `Guarded<T>::Access` handle, which holds the lock for its lifetime, or
/// through `With()`, which holds the lock for the duration of the call.
/// @tparam T the type of the guarded value
template <typename T>
class Guarded {
public:
    /// @brief Exclusive handle to the guarded value.
    template <typename TValue>
    class BasicAccess {
    public:
        BasicAccess(TValue &value, std::mutex &mutex)
            : m_value(value)
            , m_lock(mutex) {}

        TValue &operator*() const {
            return m_value;
        }

        TValue *operator->() const {
            return &m_value;
        }

    private:
        TValue &m_value;
        std::unique_lock<std::mutex> m_lock;
    };

    using Access = BasicAccess<T>;
    using ConstAccess = BasicAccess<const T>;

    template <typename... Args>
    explicit Guarded(Args &&...args)
        : m_value(std::forward<Args>(args)...) {}

    Guarded(const Guarded &) = delete;
    Guarded &operator=(const Guarded &) = delete;

    [[nodiscard]] Access Lock() {
        return Access{m_value, m_mutex};
    }

    [[nodiscard]] ConstAccess Lock() const {
        return ConstAccess{m_value, m_mutex};
    }

    /// @brief Invokes `fn` with a reference to the value while holding the lock.
    template <typename Fn>
    decltype(auto) With(Fn &&fn) {
        std::unique_lock lock{m_mutex};
        return fn(m_value);
    }

    template <typename Fn>
    decltype(auto) With(Fn &&fn) const {
        std::unique_lock lock{m_mutex};
        return fn(static_cast<const T &>(m_value));
    }

private:
    T m_value;
    mutable std::mutex m_mutex;
};

} // namespace util
