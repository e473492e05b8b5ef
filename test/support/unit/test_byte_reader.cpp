/***
 * Name: test_byte_reader
 * Purpose: Little-endian reads, cursor tracking and EOF reporting.
 */
#include <gtest/gtest.h>
#include "pymarshal/exceptions/decode_error.h"
#include "pymarshal/support/byte_reader.h"
#include "../../util/Bytes.h"

using namespace pymarshal;
using testutil::Hex;

TEST(ByteReader, ReadsLittleEndianWidths) {
  const auto buf = Hex("7f 34 12 78 56 34 12 ff ff ff ff fe dc ba 98 76 54 32 10");
  support::ByteReader r(buf);
  EXPECT_EQ(r.readU8(), 0x7Fu);
  EXPECT_EQ(r.readU16Le(), 0x1234u);
  EXPECT_EQ(r.readU32Le(), 0x12345678u);
  EXPECT_EQ(r.readI32Le(), -1);
  EXPECT_EQ(r.readI64Le(), 0x1032547698badcfeLL);
  EXPECT_TRUE(r.atEnd());
  EXPECT_EQ(r.position(), buf.size());
}

TEST(ByteReader, ReadsDouble) {
  const auto buf = Hex("00 00 00 00 00 00 f8 3f");
  support::ByteReader r(buf);
  EXPECT_DOUBLE_EQ(r.readF64Le(), 1.5);
}

TEST(ByteReader, ReadExactAndString) {
  const auto buf = testutil::Raw("abcdef");
  support::ByteReader r(buf);
  const std::uint8_t* p = r.readExact(2);
  EXPECT_EQ(p[0], 'a');
  EXPECT_EQ(p[1], 'b');
  EXPECT_EQ(r.readString(3), "cde");
  EXPECT_EQ(r.remaining(), 1u);
  EXPECT_EQ(r.readString(0), "");
}

TEST(ByteReader, UnderrunThrowsAtCursor) {
  const auto buf = Hex("01 02 03");
  support::ByteReader r(buf);
  r.readU8();
  try {
    r.readU32Le();
    FAIL() << "expected DecodeError";
  } catch (const exceptions::DecodeError& e) {
    EXPECT_EQ(e.kind(), exceptions::ErrorKind::UnexpectedEof);
    EXPECT_EQ(e.offset(), 1u);
  }
  // A failed read does not move the cursor.
  EXPECT_EQ(r.position(), 1u);
  EXPECT_THROW(r.readExact(3), exceptions::DecodeError);
}

TEST(ByteReader, EmptyBuffer) {
  support::ByteReader r(nullptr, 0);
  EXPECT_TRUE(r.atEnd());
  EXPECT_THROW(r.readU8(), exceptions::DecodeError);
}
