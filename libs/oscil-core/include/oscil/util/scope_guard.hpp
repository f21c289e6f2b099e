#pragma once

#include <utility>

namespace util {

/// @brief Invokes a function when the guard goes out of scope, unless cancelled.
/// @tparam Fn the type of the function to invoke
template <typename Fn>
class ScopeGuard {
public:
    ScopeGuard(Fn &&fn)
        : m_fn(std::move(fn)) {}

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard(ScopeGuard &&) = delete;

    ~ScopeGuard() {
        if (!m_cancelled) {
            m_fn();
        }
    }

    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /// @brief Prevents the function from being invoked on destruction.
    void Cancel() {
        m_cancelled = true;
    }

private:
    Fn m_fn;
    bool m_cancelled = false;
};

} // namespace util
