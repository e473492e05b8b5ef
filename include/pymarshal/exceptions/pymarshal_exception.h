/***
 * Name: pymarshal::exceptions::PymarshalException
 * Purpose: Base class for all pymarshal exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in pymarshal must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace pymarshal {
namespace exceptions {

class PymarshalException : public std::exception {
 public:
  virtual ~PymarshalException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit PymarshalException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace pymarshal
