/***
 * Name: pymarshal::exceptions::ValueError
 * Purpose: Exception for misuse of the value model (wrong-kind access, dangling handles).
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PymarshalException.
 */
#pragma once

#include <string>
#include <utility>

#include "pymarshal/exceptions/pymarshal_exception.h"

namespace pymarshal {
namespace exceptions {

class ValueError : public PymarshalException {
 public:
  explicit ValueError(std::string msg) noexcept : PymarshalException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pymarshal
