/***
 * Name: pymarshal::CodeObject
 * Purpose: Fixed attribute record of a serialized code object.
 * Inputs: Counts and flags as raw integers; every other attribute as a handle into the
 *   owning arena.
 * Outputs: N/A (plain record)
 * Theory of Operation:
 *   Attribute handles keep sharing visible: two code objects that reference the same
 *   empty tuple on the wire hold the same ValueId. Expected kinds:
 *     code, lnotab: Bytes      consts: Tuple
 *     names, varnames, freevars, cellvars: Tuple of Str
 *     filename, name: Str (Bytes also accepted for the Python2 layout)
 *   posonlyargcount and kwonlyargcount stay zero for layouts that lack them.
 */
#pragma once

#include <cstdint>

#include "pymarshal/model/value_id.h"

namespace pymarshal {

namespace code_flags {
inline constexpr std::uint32_t kOptimized = 0x1;
inline constexpr std::uint32_t kNewLocals = 0x2;
inline constexpr std::uint32_t kVarArgs = 0x4;
inline constexpr std::uint32_t kVarKeywords = 0x8;
inline constexpr std::uint32_t kNested = 0x10;
inline constexpr std::uint32_t kGenerator = 0x20;
inline constexpr std::uint32_t kNoFree = 0x40;
inline constexpr std::uint32_t kCoroutine = 0x80;
inline constexpr std::uint32_t kIterableCoroutine = 0x100;
inline constexpr std::uint32_t kAsyncGenerator = 0x200;
inline constexpr std::uint32_t kGeneratorAllowed = 0x1000;
inline constexpr std::uint32_t kFutureDivision = 0x2000;
inline constexpr std::uint32_t kFutureAbsoluteImport = 0x4000;
inline constexpr std::uint32_t kFutureWithStatement = 0x8000;
inline constexpr std::uint32_t kFuturePrintFunction = 0x10000;
inline constexpr std::uint32_t kFutureUnicodeLiterals = 0x20000;
inline constexpr std::uint32_t kFutureBarryAsBdfl = 0x40000;
inline constexpr std::uint32_t kFutureGeneratorStop = 0x80000;
inline constexpr std::uint32_t kFutureAnnotations = 0x100000;
}  // namespace code_flags

struct CodeObject {
  std::uint32_t argcount{0};
  std::uint32_t posonlyargcount{0};
  std::uint32_t kwonlyargcount{0};
  std::uint32_t nlocals{0};
  std::uint32_t stacksize{0};
  std::uint32_t flags{0};
  ValueId code{kInvalidValueId};
  ValueId consts{kInvalidValueId};
  ValueId names{kInvalidValueId};
  ValueId varnames{kInvalidValueId};
  ValueId freevars{kInvalidValueId};
  ValueId cellvars{kInvalidValueId};
  ValueId filename{kInvalidValueId};
  ValueId name{kInvalidValueId};
  std::uint32_t firstlineno{0};
  ValueId lnotab{kInvalidValueId};
};

}  // namespace pymarshal
