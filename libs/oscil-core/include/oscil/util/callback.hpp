#pragma once

/**
@file
@brief Lightweight context-bound callbacks.
*/

#include <type_traits>
#include <utility>

namespace util {

template <typename>
class OptionalCallback;

/// @brief A callback made of a plain function pointer and an opaque context pointer.
/// Invoking an unbound callback does nothing and returns a default-constructed value.
/// @tparam R the return type
/// @tparam Args the argument types
template <typename R, typename... Args>
class OptionalCallback<R(Args...)> {
    using FnType = R (*)(Args... args, void *context);

public:
    OptionalCallback() = default;

    OptionalCallback(void *context, FnType func)
        : m_context(context)
        , m_func(func) {}

    R operator()(Args... args) const {
        if (m_func != nullptr) {
            return m_func(std::forward<Args>(args)..., m_context);
        }
        if constexpr (!std::is_void_v<R>) {
            return R{};
        }
    }

    bool IsValid() const {
        return m_func != nullptr;
    }

    void Rebind(void *context) {
        m_context = context;
    }

private:
    void *m_context = nullptr;
    FnType m_func = nullptr;
};

} // namespace util
