/***
 * Name: pymarshal::support::IsValidUtf8 / IsAscii
 * Purpose: Strict validation of string-tag payloads.
 * Inputs: byte range
 * Outputs: true when the range is well-formed for the requested encoding
 * Theory of Operation: u_strFromUTF8 converts into a scratch UTF-16 buffer sized to the
 *   input length (UTF-16 never needs more units than UTF-8 has bytes) and reports
 *   U_INVALID_CHAR_FOUND for any ill-formed sequence, including encoded surrogates.
 */
#include "pymarshal/support/text.h"

#include <unicode/ustring.h>
#include <unicode/utypes.h>

#include <cstdint>
#include <limits>
#include <vector>

namespace pymarshal::support {

bool IsValidUtf8(const std::uint8_t* data, std::size_t n) {
  if (n == 0) { return true; }
  if (data == nullptr || n > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
    return false;
  }
  if (IsAscii(data, n)) { return true; }
  std::vector<UChar> scratch(n);
  int32_t outLen = 0;
  UErrorCode status = U_ZERO_ERROR;
  u_strFromUTF8(scratch.data(), static_cast<int32_t>(scratch.size()), &outLen,
                reinterpret_cast<const char*>(data), static_cast<int32_t>(n), &status);
  return U_SUCCESS(status);
}

bool IsValidUtf8(std::string_view text) {
  return IsValidUtf8(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

bool IsAscii(const std::uint8_t* data, std::size_t n) noexcept {
  for (std::size_t i = 0; i < n; ++i) {
    if ((data[i] & 0x80U) != 0) { return false; }
  }
  return true;
}

bool IsAscii(std::string_view text) noexcept {
  return IsAscii(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

}  // namespace pymarshal::support
