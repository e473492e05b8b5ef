/***
 * Name: pymarshal::exceptions::EncodeError
 * Purpose: Exception for values that cannot be written under the requested options.
 * Inputs: ErrorKind, output offset, detail text
 * Outputs: Exception object
 * Theory of Operation: Terminal for the encode call; partial output is discarded.
 */
#pragma once

#include "pymarshal/exceptions/codec_error.h"

namespace pymarshal {
namespace exceptions {

class EncodeError : public CodecError {
 public:
  EncodeError(ErrorKind kind, std::size_t offset, const std::string& detail);
};

}  // namespace exceptions
}  // namespace pymarshal
