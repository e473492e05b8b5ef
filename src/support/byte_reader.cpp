/***
 * Name: pymarshal::support::ByteReader (impl)
 * Purpose: Bounds-checked little-endian primitive reads.
 */
#include "pymarshal/support/byte_reader.h"

#include <cstring>
#include <string>

#include "pymarshal/exceptions/decode_error.h"

namespace pymarshal::support {

using exceptions::DecodeError;
using exceptions::ErrorKind;

ByteReader::ByteReader(const std::uint8_t* data, std::size_t size) noexcept
    : data_(data), size_(data == nullptr ? 0 : size) {}

ByteReader::ByteReader(const std::vector<std::uint8_t>& data) noexcept
    : data_(data.data()), size_(data.size()) {}

void ByteReader::require(std::size_t n) const {
  if (n > size_ - pos_) {
    throw DecodeError(ErrorKind::UnexpectedEof, pos_,
                      "need " + std::to_string(n) + " bytes, " + std::to_string(size_ - pos_) +
                          " remain");
  }
}

std::uint8_t ByteReader::readU8() {
  require(1);
  return data_[pos_++];
}

std::uint16_t ByteReader::readU16Le() {
  require(2);
  const std::uint8_t* p = data_ + pos_;
  pos_ += 2;
  return static_cast<std::uint16_t>(static_cast<std::uint16_t>(p[0]) |
                                    (static_cast<std::uint16_t>(p[1]) << 8U));
}

std::uint32_t ByteReader::readU32Le() {
  require(4);
  const std::uint8_t* p = data_ + pos_;
  pos_ += 4;
  return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8U) |
         (static_cast<std::uint32_t>(p[2]) << 16U) | (static_cast<std::uint32_t>(p[3]) << 24U);
}

std::int32_t ByteReader::readI32Le() {
  const std::uint32_t u = readU32Le();
  std::int32_t s;
  std::memcpy(&s, &u, sizeof(s));
  return s;
}

std::int64_t ByteReader::readI64Le() {
  require(8);
  const std::uint8_t* p = data_ + pos_;
  pos_ += 8;
  std::uint64_t u = 0;
  for (int i = 7; i >= 0; --i) {
    u = (u << 8U) | static_cast<std::uint64_t>(p[i]);
  }
  std::int64_t s;
  std::memcpy(&s, &u, sizeof(s));
  return s;
}

double ByteReader::readF64Le() {
  const std::int64_t bits = readI64Le();
  static_assert(sizeof(double) == 8, "double must be 8 bytes");
  double d;
  std::memcpy(&d, &bits, sizeof(d));
  return d;
}

const std::uint8_t* ByteReader::readExact(std::size_t n) {
  require(n);
  const std::uint8_t* p = data_ + pos_;
  pos_ += n;
  return p;
}

std::string ByteReader::readString(std::size_t n) {
  const std::uint8_t* p = readExact(n);
  return std::string(reinterpret_cast<const char*>(p), n);
}

}  // namespace pymarshal::support
