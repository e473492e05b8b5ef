/***
 * Name: pymarshal::support::ByteReader
 * Purpose: Sequential little-endian reader over a fully buffered byte range.
 * Inputs: Pointer and size of a caller-owned buffer that outlives the reader
 * Outputs: Fixed-width integers, doubles and raw byte spans
 * Theory of Operation: Keeps a single cursor; every read checks the remaining length
 *   first and throws DecodeError(UnexpectedEof) at the cursor position on underrun,
 *   leaving the cursor unchanged. Carries no knowledge of value semantics.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pymarshal {
namespace support {

class ByteReader {
 public:
  ByteReader(const std::uint8_t* data, std::size_t size) noexcept;
  explicit ByteReader(const std::vector<std::uint8_t>& data) noexcept;

  std::uint8_t readU8();
  std::uint16_t readU16Le();
  std::uint32_t readU32Le();
  std::int32_t readI32Le();
  std::int64_t readI64Le();
  double readF64Le();

  /*** readExact: Return a pointer to the next n bytes and advance past them. */
  const std::uint8_t* readExact(std::size_t n);
  /*** readString: Copy the next n bytes into a std::string. */
  std::string readString(std::size_t n);

  std::size_t position() const noexcept { return pos_; }
  std::size_t remaining() const noexcept { return size_ - pos_; }
  std::size_t size() const noexcept { return size_; }
  bool atEnd() const noexcept { return pos_ == size_; }

 private:
  void require(std::size_t n) const;

  const std::uint8_t* data_;
  std::size_t size_;
  std::size_t pos_{0};
};

}  // namespace support
}  // namespace pymarshal
