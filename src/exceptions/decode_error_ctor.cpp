/***
 * Name: pymarshal::exceptions::DecodeError::DecodeError
 * Purpose: Construct a decode failure.
 */
#include "pymarshal/exceptions/decode_error.h"

namespace pymarshal::exceptions {

DecodeError::DecodeError(ErrorKind kind, std::size_t offset, const std::string& detail)
    : CodecError("decode", kind, offset, detail) {}

}  // namespace pymarshal::exceptions
