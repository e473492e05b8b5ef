/***
 * Name: test_decode_code
 * Purpose: Code object decoding under each layout, sharing, and field type checks.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "pymarshal/codec/marshal.h"
#include "pymarshal/exceptions/decode_error.h"
#include "../../util/Bytes.h"

using namespace pymarshal;
using testutil::Concat;
using testutil::Hex;

namespace {

const char* kExceptionsCode =
    "e3 01 00 00 00 00 00 00 00 02 00 00 00 05 00 00 00 43 00 00 00 73 20 00 00 00 74 00 a0 01 "
    "74 00 a0 02 74 03 a1 01 a1 01 7d 01 7c 00 a0 04 74 03 7c 01 a1 02 01 00 64 00 53 00 29 01 "
    "4e 29 05 da 07 6d 61 72 73 68 61 6c da 05 6c 6f 61 64 73 da 05 64 75 6d 70 73 da 0d 53 74 "
    "6f 70 49 74 65 72 61 74 69 6f 6e da 0b 61 73 73 65 72 74 45 71 75 61 6c 29 02 da 04 73 65 "
    "6c 66 da 03 6e 65 77 a9 00 72 08 00 00 00 da 08 3c 73 74 72 69 6e 67 3e da 0f 74 65 73 74 "
    "5f 65 78 63 65 70 74 69 6f 6e 73 03 00 00 00 73 04 00 00 00 00 01 10 01";

Options python30() {
  Options o;
  o.code_layout = CodeLayout::Python30;
  return o;
}

std::vector<std::string> texts(const Document& doc, ValueId tuple) {
  std::vector<std::string> out;
  for (ValueId e : doc.at(tuple).elements()) { out.push_back(doc.at(e).asText()); }
  return out;
}

void expectExceptionsCode(const Document& doc, ValueId id) {
  const CodeObject& c = doc.at(id).code();
  EXPECT_EQ(c.argcount, 1u);
  EXPECT_EQ(c.posonlyargcount, 0u);
  EXPECT_EQ(c.kwonlyargcount, 0u);
  EXPECT_EQ(c.nlocals, 2u);
  EXPECT_EQ(c.stacksize, 5u);
  EXPECT_EQ(c.flags, code_flags::kNoFree | code_flags::kNewLocals | code_flags::kOptimized);
  EXPECT_EQ(doc.at(c.code).asBytes().size(), 32u);
  ASSERT_EQ(doc.at(c.consts).elements().size(), 1u);
  EXPECT_EQ(doc.at(doc.at(c.consts).elements()[0]).kind(), Kind::None);
  EXPECT_EQ(texts(doc, c.names),
            (std::vector<std::string>{"marshal", "loads", "dumps", "StopIteration", "assertEqual"}));
  EXPECT_EQ(texts(doc, c.varnames), (std::vector<std::string>{"self", "new"}));
  EXPECT_TRUE(doc.at(c.freevars).elements().empty());
  EXPECT_EQ(c.freevars, c.cellvars);
  EXPECT_EQ(doc.at(c.filename).asText(), "<string>");
  EXPECT_EQ(doc.at(c.name).asText(), "test_exceptions");
  EXPECT_EQ(c.firstlineno, 3u);
  EXPECT_EQ(doc.at(c.lnotab).asBytes(), std::string("\x00\x01\x10\x01", 4));
}

} // namespace

TEST(DecodeCode, Python30Layout) {
  const auto doc = Decode(Hex(kExceptionsCode), python30());
  ASSERT_EQ(doc.rootValue().kind(), Kind::Code);
  expectExceptionsCode(doc, doc.root());
  EXPECT_TRUE(doc.rootValue().wireFlagged());
}

TEST(DecodeCode, ManyReferencesToOneCodeObject) {
  const auto blob = Concat(Concat(Hex("28 88 13 00 00"), Hex(kExceptionsCode)),
                           testutil::Repeat(Hex("72 00 00 00 00"), 4999));
  const auto doc = Decode(blob, python30());
  const auto& items = doc.rootValue().elements();
  ASSERT_EQ(items.size(), 5000u);
  expectExceptionsCode(doc, items[0]);
  for (ValueId e : items) { EXPECT_EQ(e, items[0]); }
}

TEST(DecodeCode, DifferentFilenamesThroughReferences) {
  const auto doc = Decode(Hex(
      "29 02 63 00 00 00 00 00 00 00 00 00 00 00 00 01 00 00 00 40 00 00 00 73 08 00 00 00 65 00 "
      "01 00 64 00 53 00 29 01 4e 29 01 da 01 78 a9 00 72 01 00 00 00 72 01 00 00 00 da 02 66 31 "
      "da 08 3c 6d 6f 64 75 6c 65 3e 01 00 00 00 f3 00 00 00 00 63 00 00 00 00 00 00 00 00 00 00 "
      "00 00 01 00 00 00 40 00 00 00 73 08 00 00 00 65 00 01 00 64 00 53 00 29 01 4e 29 01 da 01 "
      "79 72 01 00 00 00 72 01 00 00 00 72 01 00 00 00 da 02 66 32 72 03 00 00 00 01 00 00 00 72 "
      "04 00 00 00"), python30());
  const auto& items = doc.rootValue().elements();
  ASSERT_EQ(items.size(), 2u);
  const CodeObject& f1 = doc.at(items[0]).code();
  const CodeObject& f2 = doc.at(items[1]).code();
  EXPECT_EQ(doc.at(f1.filename).asText(), "f1");
  EXPECT_EQ(doc.at(f2.filename).asText(), "f2");
  EXPECT_EQ(f1.name, f2.name);
  EXPECT_EQ(f1.lnotab, f2.lnotab);
  EXPECT_EQ(f1.flags, code_flags::kNoFree);
}

TEST(DecodeCode, Python38LayoutFieldOrder) {
  const auto doc = Decode(Hex(
      "e3 03 00 00 00 01 00 00 00 02 00 00 00 03 00 00 00 02 00 00 00 43 00 00 00 "
      "73 04 00 00 00 64 00 53 00 29 01 4e 29 00 29 00 29 00 29 00 "
      "7a 04 66 2e 70 79 7a 08 3c 6d 6f 64 75 6c 65 3e 07 00 00 00 73 00 00 00 00"), 4);
  const CodeObject& c = doc.rootValue().code();
  EXPECT_EQ(c.argcount, 3u);
  EXPECT_EQ(c.posonlyargcount, 1u);
  EXPECT_EQ(c.kwonlyargcount, 2u);
  EXPECT_EQ(c.nlocals, 3u);
  EXPECT_EQ(c.stacksize, 2u);
  EXPECT_EQ(c.flags, 0x43u);
  EXPECT_EQ(doc.at(c.filename).asText(), "f.py");
  EXPECT_EQ(c.firstlineno, 7u);
}

TEST(DecodeCode, Python2LayoutAcceptsByteNames) {
  Options o = OptionsForVersion(2);
  o.code_layout = CodeLayout::Python2;
  const auto doc = Decode(Hex(
      "63 01 00 00 00 01 00 00 00 01 00 00 00 43 00 00 00 73 03 00 00 00 64 00 53 "
      "28 01 00 00 00 4e 28 00 00 00 00 28 01 00 00 00 74 01 00 00 00 78 28 00 00 00 00 "
      "28 00 00 00 00 73 04 00 00 00 61 2e 70 79 74 01 00 00 00 66 01 00 00 00 73 00 00 00 00"), o);
  const CodeObject& c = doc.rootValue().code();
  EXPECT_EQ(c.argcount, 1u);
  EXPECT_EQ(c.nlocals, 1u);
  EXPECT_EQ(doc.at(c.filename).asBytes(), "a.py");
  EXPECT_EQ(doc.at(c.name).asText(), "f");
  EXPECT_TRUE(doc.at(c.name).isInterned());
  EXPECT_EQ(doc.referenceCount(), 2u);
}

TEST(DecodeCode, FieldKindsAreChecked) {
  // consts is None instead of a tuple
  try {
    Decode(Hex("63 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 "
               "73 00 00 00 00 4e"), 4);
    FAIL() << "expected DecodeError";
  } catch (const exceptions::DecodeError& e) {
    EXPECT_EQ(e.kind(), exceptions::ErrorKind::TypeMismatch);
    EXPECT_EQ(e.offset(), 30u);
  }
  // names holds an int
  try {
    Decode(Hex("63 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 00 "
               "73 00 00 00 00 29 00 29 01 69 01 00 00 00"), 4);
    FAIL() << "expected DecodeError";
  } catch (const exceptions::DecodeError& e) {
    EXPECT_EQ(e.kind(), exceptions::ErrorKind::TypeMismatch);
  }
}
