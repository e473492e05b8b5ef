// Utility: build byte buffers from hex text such as "a9 03 e9 01 00 00 00"
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace testutil {

inline int hexNibble(char c) {
  if (c >= '0' && c <= '9') { return c - '0'; }
  if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
  if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
  return -1;
}

inline std::vector<std::uint8_t> Hex(std::string_view text) {
  std::vector<std::uint8_t> out;
  int high = -1;
  for (char c : text) {
    if (c == ' ' || c == '\n') { continue; }
    const int nib = hexNibble(c);
    if (nib < 0) { throw std::invalid_argument(std::string("bad hex digit: ") + c); }
    if (high < 0) {
      high = nib;
    } else {
      out.push_back(static_cast<std::uint8_t>((high << 4) | nib));
      high = -1;
    }
  }
  if (high >= 0) { throw std::invalid_argument("odd number of hex digits"); }
  return out;
}

inline std::vector<std::uint8_t> Raw(std::string_view text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

inline std::vector<std::uint8_t> Concat(std::vector<std::uint8_t> a, const std::vector<std::uint8_t>& b) {
  a.insert(a.end(), b.begin(), b.end());
  return a;
}

inline std::vector<std::uint8_t> Repeat(const std::vector<std::uint8_t>& unit, std::size_t times) {
  std::vector<std::uint8_t> out;
  out.reserve(unit.size() * times);
  for (std::size_t i = 0; i < times; ++i) { out.insert(out.end(), unit.begin(), unit.end()); }
  return out;
}

// Little-endian u32, as used by counts and reference indices.
inline std::vector<std::uint8_t> U32(std::uint32_t v) {
  return {static_cast<std::uint8_t>(v), static_cast<std::uint8_t>(v >> 8U),
          static_cast<std::uint8_t>(v >> 16U), static_cast<std::uint8_t>(v >> 24U)};
}

} // namespace testutil
