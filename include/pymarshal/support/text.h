/***
 * Name: pymarshal::support (text)
 * Purpose: Validation helpers for the text payloads of string tags.
 * Inputs: Raw byte ranges
 * Outputs: Validity booleans
 * Theory of Operation: UTF-8 validation is delegated to ICU's strict converter, which
 *   rejects overlong forms, surrogate code points and truncated sequences. ASCII is a
 *   plain high-bit scan.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace pymarshal {
namespace support {

/*** IsValidUtf8: True when data[0..n) is well-formed UTF-8. */
bool IsValidUtf8(const std::uint8_t* data, std::size_t n);
bool IsValidUtf8(std::string_view text);

/*** IsAscii: True when every byte is below 0x80. */
bool IsAscii(const std::uint8_t* data, std::size_t n) noexcept;
bool IsAscii(std::string_view text) noexcept;

}  // namespace support
}  // namespace pymarshal
