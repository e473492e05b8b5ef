/***
 * Name: pymarshal::exceptions::ErrorKindName
 * Purpose: Map an ErrorKind to its stable snake_case name.
 * Inputs: kind
 * Outputs: Static C-string
 */
#include "pymarshal/exceptions/error_kind.h"

namespace pymarshal::exceptions {

const char* ErrorKindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::UnexpectedEof: return "unexpected_eof";
    case ErrorKind::UnknownTypeTag: return "unknown_type_tag";
    case ErrorKind::BadBackreference: return "bad_backreference";
    case ErrorKind::RecursionLimitExceeded: return "recursion_limit_exceeded";
    case ErrorKind::InvalidLength: return "invalid_length";
    case ErrorKind::InvalidText: return "invalid_text";
    case ErrorKind::UnsupportedForVersion: return "unsupported_for_version";
    case ErrorKind::UnexpectedNull: return "unexpected_null";
    case ErrorKind::MalformedLong: return "malformed_long";
    case ErrorKind::MalformedFloat: return "malformed_float";
    case ErrorKind::TypeMismatch: return "type_mismatch";
    case ErrorKind::UnhashableKey: return "unhashable_key";
    case ErrorKind::UnmarshallableValue: return "unmarshallable_value";
  }
  return "unknown";
}

}  // namespace pymarshal::exceptions
