/***
 * Name: pymarshal::ValueId
 * Purpose: Handle of a node inside an ObjectArena.
 * Theory of Operation: Plain index; identity of two handles within one arena is
 *   identity of the underlying objects.
 */
#pragma once

#include <cstdint>

namespace pymarshal {

using ValueId = std::uint32_t;
inline constexpr ValueId kInvalidValueId = 0xFFFFFFFFU;

}  // namespace pymarshal
