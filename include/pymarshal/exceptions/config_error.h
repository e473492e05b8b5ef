/***
 * Name: pymarshal::exceptions::ConfigError
 * Purpose: Exception for invalid codec options (version, depth limit, layout).
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

class ConfigError : public PymarshalException {
 public:
  explicit ConfigError(std::string msg) noexcept : PymarshalException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pymarshal
