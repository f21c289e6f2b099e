#pragma once

/**
@file
@brief Basic numeric type aliases.
*/

#include <cstddef>
#include <cstdint>

using uint8 = uint8_t;
using uint16 = uint16_t;
using uint32 = uint32_t;
using uint64 = uint64_t;

using sint8 = int8_t;
using sint16 = int16_t;
using sint32 = int32_t;
using sint64 = int64_t;

using uintptr = uintptr_t;
using sintptr = intptr_t;

using float32 = float;
using float64 = double;
