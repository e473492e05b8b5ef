/***
 * Name: pymarshal::exceptions::EncodeError::EncodeError
 * Purpose: Construct an encode failure.
 */
#include "pymarshal/exceptions/encode_error.h"

namespace pymarshal::exceptions {

EncodeError::EncodeError(ErrorKind kind, std::size_t offset, const std::string& detail)
    : CodecError("encode", kind, offset, detail) {}

}  // namespace pymarshal::exceptions
