/***
 * Name: pymarshal::exceptions::DecodeError
 * Purpose: Exception for rejected marshal input.
 * Inputs: ErrorKind, input offset, detail text
 * Outputs: Exception object
 * Theory of Operation: Terminal for the decode call; no partial value is returned.
 */
#pragma once

#include "pymarshal/exceptions/codec_error.h"

namespace pymarshal {
namespace exceptions {

class DecodeError : public CodecError {
 public:
  DecodeError(ErrorKind kind, std::size_t offset, const std::string& detail);
};

}  // namespace exceptions
}  // namespace pymarshal
