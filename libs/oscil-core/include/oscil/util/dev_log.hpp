#pragma once

/**
@file
@brief Development log facility.

Log messages are organized in groups. A group is a struct with the following static members:

```cpp
struct my_group {
    static constexpr bool enabled = true;                       // whether the group is enabled at all
    static constexpr devlog::Level level = devlog::level::debug; // minimum level printed for this group
    static constexpr std::string_view name = "My-Group";         // name printed alongside the message
};
```

Groups can inherit from other groups to share settings and override individual members.

The whole facility compiles to nothing unless `Oscil_ENABLE_DEVLOG` is defined to a nonzero value.
*/

#include <oscil/core/types.hpp>

#include <fmt/format.h>

#include <array>
#include <concepts>
#include <cstdio>
#include <string_view>
#include <utility>

#ifndef Oscil_ENABLE_DEVLOG
    #define Oscil_ENABLE_DEVLOG 0
#endif

namespace devlog {

using Level = uint8;

namespace level {
    inline constexpr Level trace = 0;
    inline constexpr Level debug = 1;
    inline constexpr Level info = 2;
    inline constexpr Level warn = 3;
    inline constexpr Level error = 4;
    inline constexpr Level off = 5;
} // namespace level

/// @brief Whether the development log is compiled in.
inline constexpr bool kEnabled = Oscil_ENABLE_DEVLOG;

namespace detail {

    inline constexpr std::array<std::string_view, 5> kLevelNames = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR"};

    template <typename T>
    concept Group = requires {
        { T::enabled } -> std::convertible_to<bool>;
        { T::level } -> std::convertible_to<Level>;
        { T::name } -> std::convertible_to<std::string_view>;
    };

    template <Level lv, Group TGroup>
    inline constexpr bool kShouldLog = kEnabled && TGroup::enabled && lv >= TGroup::level && lv < level::off;

    template <Level lv, Group TGroup, typename... TArgs>
    inline void Log(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
        if constexpr (kShouldLog<lv, TGroup>) {
            std::FILE *out = lv >= level::warn ? stderr : stdout;
            auto msg = fmt::format(fmt, std::forward<TArgs>(args)...);
            fmt::print(out, "{:5} | {:16} | {}\n", kLevelNames[lv], TGroup::name, msg);
        }
    }

} // namespace detail

template <detail::Group TGroup, typename... TArgs>
inline void trace(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::Log<level::trace, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
inline void debug(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::Log<level::debug, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
inline void info(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::Log<level::info, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
inline void warn(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::Log<level::warn, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <detail::Group TGroup, typename... TArgs>
inline void error(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::Log<level::error, TGroup>(fmt, std::forward<TArgs>(args)...);
}

} // namespace devlog
