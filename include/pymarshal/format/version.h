/***
 * Name: pymarshal::format (version)
 * Purpose: Marshal format versions and the features each one introduces.
 * Inputs: N/A
 * Outputs: Version constants and per-tag minimum versions
 * Theory of Operation:
 *   0: base tags, textual floats.
 *   1: interned strings ('t') and the legacy interned-string table ('R').
 *   2: binary floats and complex numbers ('g', 'y').
 *   3: general references ('r') and the reference flag; 'R' is retired.
 *   4: compact ASCII strings ('a', 'A', 'z', 'Z') and small tuples (')').
 */
#pragma once

#include "pymarshal/format/type_code.h"

namespace pymarshal {
namespace format {

inline constexpr int kMinVersion = 0;
inline constexpr int kMaxVersion = 4;
inline constexpr int kCurrentVersion = 4;

inline constexpr int kVersionInterning = 1;
inline constexpr int kVersionBinaryFloat = 2;
inline constexpr int kVersionReferences = 3;
inline constexpr int kVersionCompact = 4;

/*** IsTypeCodeSupported: Whether a tag may appear in a stream of the given version. */
bool IsTypeCodeSupported(TypeCode code, int version) noexcept;

}  // namespace format
}  // namespace pymarshal
