/***
 * Name: pymarshal::exceptions::CodecError
 * Purpose: Common base for decode and encode failures.
 * Inputs:
 *   - direction: "decode" or "encode" (message prefix)
 *   - kind: ErrorKind category
 *   - offset: byte offset in the input (decode) or output (encode) where the failure arose
 *   - detail: free-form context
 * Outputs: Exception object exposing kind() and offset()
 * Theory of Operation: Formats "<direction> error at offset N: <kind>: <detail>" once at
 *   construction; the kind is kept separately so tests and callers can branch on it.
 */
#pragma once

#include <cstddef>
#include <string>

#include "pymarshal/exceptions/error_kind.h"
#include "pymarshal/exceptions/pymarshal_exception.h"

namespace pymarshal {
namespace exceptions {

class CodecError : public PymarshalException {
 public:
  ErrorKind kind() const noexcept { return kind_; }
  std::size_t offset() const noexcept { return offset_; }

 protected:
  CodecError(const char* direction, ErrorKind kind, std::size_t offset, const std::string& detail);

 private:
  ErrorKind kind_;
  std::size_t offset_;
};

}  // namespace exceptions
}  // namespace pymarshal
