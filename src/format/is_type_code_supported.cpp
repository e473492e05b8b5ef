/***
 * Name: pymarshal::format::IsTypeCodeSupported
 * Purpose: Version gate for tag codes.
 * Inputs: code, version
 * Outputs: true when code is defined under version
 * Theory of Operation: Legacy tags ('f', 'x', 'I') stay readable in newer versions.
 *   'R' exists only between interning and references.
 */
#include "pymarshal/format/version.h"

namespace pymarshal::format {

bool IsTypeCodeSupported(TypeCode code, int version) noexcept {
  switch (code) {
    case TypeCode::Interned:
      return version >= kVersionInterning;
    case TypeCode::StringRef:
      return version >= kVersionInterning && version < kVersionReferences;
    case TypeCode::BinaryFloat:
    case TypeCode::BinaryComplex:
      return version >= kVersionBinaryFloat;
    case TypeCode::Ref:
      return version >= kVersionReferences;
    case TypeCode::SmallTuple:
    case TypeCode::Ascii:
    case TypeCode::AsciiInterned:
    case TypeCode::ShortAscii:
    case TypeCode::ShortAsciiInterned:
      return version >= kVersionCompact;
    default:
      return true;
  }
}

}  // namespace pymarshal::format
