#pragma once

/**
@file
@brief Access to resources embedded in the core library.
*/

#include <optional>
#include <string>
#include <string_view>

namespace oscil::res {

/// @brief Retrieves the contents of an embedded text resource.
/// @param[in] path the resource path, relative to the `res` directory of the core library
/// @return a view over the resource contents, valid for the lifetime of the program, or `std::nullopt` if the resource
/// does not exist
std::optional<std::string_view> LoadText(const std::string &path);

} // namespace oscil::res
