/***
 * Name: pymarshal::support::ByteWriter
 * Purpose: Append-only little-endian writer that owns its output buffer.
 * Inputs: Fixed-width integers, doubles and raw byte ranges
 * Outputs: A contiguous byte vector released via take()
 * Theory of Operation: Mirrors ByteReader; every multi-byte value is emitted
 *   least-significant byte first regardless of host order.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace pymarshal {
namespace support {

class ByteWriter {
 public:
  void writeU8(std::uint8_t v);
  void writeU16Le(std::uint16_t v);
  void writeU32Le(std::uint32_t v);
  void writeI32Le(std::int32_t v);
  void writeI64Le(std::int64_t v);
  void writeF64Le(double v);
  void writeBytes(const std::uint8_t* data, std::size_t n);
  void writeBytes(std::string_view data);

  std::size_t size() const noexcept { return buf_.size(); }
  const std::vector<std::uint8_t>& data() const noexcept { return buf_; }
  std::vector<std::uint8_t> take() noexcept;

 private:
  std::vector<std::uint8_t> buf_;
};

}  // namespace support
}  // namespace pymarshal
