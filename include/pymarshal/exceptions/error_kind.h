/***
 * Name: pymarshal::exceptions::ErrorKind
 * Purpose: Closed taxonomy of codec failures shared by decode and encode.
 * Inputs: N/A
 * Outputs: Enumerators and their stable display names
 * Theory of Operation: Every CodecError carries exactly one kind so callers can
 *   reject input by category without parsing messages.
 */
#pragma once

namespace pymarshal {
namespace exceptions {

enum class ErrorKind {
  UnexpectedEof,
  UnknownTypeTag,
  BadBackreference,
  RecursionLimitExceeded,
  InvalidLength,
  InvalidText,
  UnsupportedForVersion,
  UnexpectedNull,
  MalformedLong,
  MalformedFloat,
  TypeMismatch,
  UnhashableKey,
  UnmarshallableValue,
};

/*** ErrorKindName: snake_case name of a kind, e.g. "unexpected_eof". */
const char* ErrorKindName(ErrorKind kind) noexcept;

}  // namespace exceptions
}  // namespace pymarshal
