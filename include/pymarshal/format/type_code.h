/***
 * Name: pymarshal::format::TypeCode
 * Purpose: The closed, frozen enumeration of marshal tag bytes.
 * Inputs: N/A
 * Outputs: Enumerators whose values are the on-wire tag bytes
 * Theory of Operation:
 *   The low seven bits of a tag byte select the type code; bit 7 (kFlagRef) asks the
 *   reader to register the object in the reference table. Values are fixed by existing
 *   serialized corpora and must never be renumbered.
 */
#pragma once

#include <cstdint>
#include <optional>

namespace pymarshal {
namespace format {

enum class TypeCode : std::uint8_t {
  Null = '0',
  None = 'N',
  False = 'F',
  True = 'T',
  StopIteration = 'S',
  Ellipsis = '.',
  Int = 'i',
  Int64 = 'I',
  Float = 'f',
  BinaryFloat = 'g',
  Complex = 'x',
  BinaryComplex = 'y',
  Long = 'l',
  String = 's',
  Interned = 't',
  Ref = 'r',
  StringRef = 'R',
  Tuple = '(',
  SmallTuple = ')',
  List = '[',
  Dict = '{',
  Code = 'c',
  Unicode = 'u',
  Unknown = '?',
  Set = '<',
  FrozenSet = '>',
  Ascii = 'a',
  AsciiInterned = 'A',
  ShortAscii = 'z',
  ShortAsciiInterned = 'Z',
};

inline constexpr std::uint8_t kFlagRef = 0x80;
inline constexpr std::uint8_t kTypeMask = 0x7F;

/*** TypeCodeFromByte: Map the low seven bits of a tag to a TypeCode, or nullopt if unassigned. */
std::optional<TypeCode> TypeCodeFromByte(std::uint8_t code) noexcept;

/*** TypeCodeName: Stable display name, e.g. "SmallTuple". */
const char* TypeCodeName(TypeCode code) noexcept;

/*** TagByte: The on-wire byte for code, with the reference flag when flagged. */
constexpr std::uint8_t TagByte(TypeCode code, bool flagged = false) noexcept {
  return static_cast<std::uint8_t>(static_cast<std::uint8_t>(code) | (flagged ? kFlagRef : 0U));
}

}  // namespace format
}  // namespace pymarshal
