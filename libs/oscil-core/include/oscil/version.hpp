#pragma once

/**
@file
@brief Oscil library version definitions.

`Oscil_VERSION` and its components are defined by the build system.
*/

#if Oscil_DEV_BUILD
    #define Oscil_FULL_VERSION Oscil_VERSION "-dev"
#else
    #define Oscil_FULL_VERSION Oscil_VERSION
#endif

namespace oscil::version {

/// @brief The library version string in the format "<major>.<minor>.<patch>".
inline constexpr auto string = Oscil_VERSION;

/// @brief The library version string, with a `-dev` suffix for development builds.
inline constexpr auto fullstring = Oscil_FULL_VERSION;

inline constexpr auto major = static_cast<unsigned>(Oscil_VERSION_MAJOR); ///< The library's major version
inline constexpr auto minor = static_cast<unsigned>(Oscil_VERSION_MINOR); ///< The library's minor version
inline constexpr auto patch = static_cast<unsigned>(Oscil_VERSION_PATCH); ///< The library's patch version

/// @brief Whether this is a development build.
inline constexpr bool is_dev_build = Oscil_DEV_BUILD;

} // namespace oscil::version
