/***
 * Name: pymarshal::Kind
 * Purpose: Closed set of value kinds held by the arena.
 * Inputs: N/A
 * Outputs: Enumerators and display names
 * Theory of Operation: One kind per logical value, independent of the wire tag that
 *   carried it (e.g. 'z', 'a' and 'u' all decode to Str). Int is the 64-bit fast path,
 *   Long the arbitrary-precision path; they compare equal when numerically equal.
 */
#pragma once

#include <cstdint>

namespace pymarshal {

enum class Kind : std::uint8_t {
  None,
  Bool,
  StopIteration,
  Ellipsis,
  Int,
  Long,
  Float,
  Complex,
  Bytes,
  Str,
  Tuple,
  List,
  Dict,
  Set,
  FrozenSet,
  Code,
  Unknown,
};

const char* KindName(Kind kind) noexcept;

/*** IsSingletonKind: None, Bool, StopIteration and Ellipsis never enter the reference table. */
constexpr bool IsSingletonKind(Kind kind) noexcept {
  return kind == Kind::None || kind == Kind::Bool || kind == Kind::StopIteration ||
         kind == Kind::Ellipsis;
}

}  // namespace pymarshal
