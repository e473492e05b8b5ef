/***
 * Name: pymarshal::exceptions::PymarshalException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "pymarshal/exceptions/pymarshal_exception.h"

namespace pymarshal::exceptions {

const char* PymarshalException::what() const noexcept { return message_.c_str(); }

}  // namespace pymarshal::exceptions
