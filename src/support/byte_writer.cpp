/***
 * Name: pymarshal::support::ByteWriter (impl)
 * Purpose: Little-endian primitive writes into an owned buffer.
 */
#include "pymarshal/support/byte_writer.h"

#include <cstring>
#include <utility>

namespace pymarshal::support {

void ByteWriter::writeU8(std::uint8_t v) { buf_.push_back(v); }

void ByteWriter::writeU16Le(std::uint16_t v) {
  buf_.push_back(static_cast<std::uint8_t>(v & 0xFFU));
  buf_.push_back(static_cast<std::uint8_t>((v >> 8U) & 0xFFU));
}

void ByteWriter::writeU32Le(std::uint32_t v) {
  buf_.push_back(static_cast<std::uint8_t>(v & 0xFFU));
  buf_.push_back(static_cast<std::uint8_t>((v >> 8U) & 0xFFU));
  buf_.push_back(static_cast<std::uint8_t>((v >> 16U) & 0xFFU));
  buf_.push_back(static_cast<std::uint8_t>((v >> 24U) & 0xFFU));
}

void ByteWriter::writeI32Le(std::int32_t v) {
  std::uint32_t u;
  std::memcpy(&u, &v, sizeof(u));
  writeU32Le(u);
}

void ByteWriter::writeI64Le(std::int64_t v) {
  std::uint64_t u;
  std::memcpy(&u, &v, sizeof(u));
  for (int i = 0; i < 8; ++i) {
    buf_.push_back(static_cast<std::uint8_t>(u & 0xFFU));
    u >>= 8U;
  }
}

void ByteWriter::writeF64Le(double v) {
  std::int64_t bits;
  std::memcpy(&bits, &v, sizeof(bits));
  writeI64Le(bits);
}

void ByteWriter::writeBytes(const std::uint8_t* data, std::size_t n) {
  if (n == 0) { return; }
  buf_.insert(buf_.end(), data, data + n);
}

void ByteWriter::writeBytes(std::string_view data) {
  writeBytes(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

std::vector<std::uint8_t> ByteWriter::take() noexcept { return std::move(buf_); }

}  // namespace pymarshal::support
