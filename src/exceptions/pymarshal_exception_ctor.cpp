/***
 * Name: pymarshal::exceptions::PymarshalException::PymarshalException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "pymarshal/exceptions/pymarshal_exception.h"

#include <utility>

namespace pymarshal {
namespace exceptions {

PymarshalException::PymarshalException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace pymarshal
