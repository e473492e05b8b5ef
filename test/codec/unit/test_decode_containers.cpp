/***
 * Name: test_decode_containers
 * Purpose: Tuples, lists, dicts, sets and frozensets, including duplicate handling.
 */
#include <gtest/gtest.h>
#include <string>
#include "pymarshal/codec/marshal.h"
#include "pymarshal/model/equality.h"
#include "../../util/Bytes.h"

using namespace pymarshal;
using testutil::Hex;

static ValueId lookup(const Document& doc, ValueId dict, const std::string& key) {
  for (const auto& [k, v] : doc.at(dict).entries()) {
    if (doc.at(k).kind() == Kind::Str && doc.at(k).asText() == key) { return v; }
  }
  ADD_FAILURE() << "missing key " << key;
  return kInvalidValueId;
}

TEST(DecodeContainers, TuplesAndLists) {
  const auto t = Decode(Hex("28 02 00 00 00 69 01 00 00 00 69 02 00 00 00"), 2);
  ASSERT_EQ(t.rootValue().kind(), Kind::Tuple);
  ASSERT_EQ(t.rootValue().elements().size(), 2u);
  EXPECT_EQ(t.at(t.rootValue().elements()[1]).asInt(), 2);
  const auto l = Decode(Hex("db 03 00 00 00 e9 01 00 00 00 e9 02 00 00 00 e9 03 00 00 00"), 4);
  EXPECT_EQ(l.rootValue().kind(), Kind::List);
  EXPECT_EQ(l.rootValue().elements().size(), 3u);
  EXPECT_EQ(l.referenceCount(), 4u);
  const auto empty = Decode(Hex("a9 00"), 4);
  EXPECT_TRUE(empty.rootValue().elements().empty());
}

TEST(DecodeContainers, ReferenceRuntimeDict) {
  const auto doc = Decode(Hex(
      "7b da 07 61 73 74 72 69 6e 67 fa 10 66 6f 6f 40 62 61 72 2e 62 61 7a 2e 73 70 61 6d da 06 "
      "61 66 6c 6f 61 74 e7 48 e1 7a 14 6e 73 bc 40 da 05 61 6e 69 6e 74 e9 00 00 10 00 da 0a 61 "
      "73 68 6f 72 74 6c 6f 6e 67 e9 02 00 00 00 da 05 61 6c 69 73 74 5b 01 00 00 00 fa 07 2e 7a "
      "79 78 2e 34 31 da 06 61 74 75 70 6c 65 a9 0a fa 07 2e 7a 79 78 2e 34 31 72 0c 00 00 00 72 "
      "0c 00 00 00 72 0c 00 00 00 72 0c 00 00 00 72 0c 00 00 00 72 0c 00 00 00 72 0c 00 00 00 72 "
      "0c 00 00 00 72 0c 00 00 00 da 08 61 62 6f 6f 6c 65 61 6e 46 da 08 61 75 6e 69 63 6f 64 65 "
      "f5 0d 00 00 00 41 6e 64 72 c3 a8 20 50 72 65 76 69 6e 30"), 4);
  const ValueId root = doc.root();
  ASSERT_EQ(doc.rootValue().entries().size(), 8u);
  EXPECT_EQ(doc.at(lookup(doc, root, "astring")).asText(), "foo@bar.baz.spam");
  EXPECT_EQ(doc.at(lookup(doc, root, "afloat")).asFloat(), 7283.43);
  EXPECT_EQ(doc.at(lookup(doc, root, "anint")).asInt(), 1 << 20);
  EXPECT_EQ(doc.at(lookup(doc, root, "ashortlong")).asInt(), 2);
  const auto& list = doc.at(lookup(doc, root, "alist")).elements();
  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(doc.at(list[0]).asText(), ".zyx.41");
  const auto& tuple = doc.at(lookup(doc, root, "atuple")).elements();
  ASSERT_EQ(tuple.size(), 10u);
  for (ValueId e : tuple) { EXPECT_EQ(e, tuple[0]); }
  EXPECT_EQ(doc.at(tuple[0]).asText(), ".zyx.41");
  EXPECT_FALSE(doc.at(lookup(doc, root, "aboolean")).asBool());
  EXPECT_EQ(doc.at(lookup(doc, root, "aunicode")).asText(), "Andr\xc3\xa8 Previn");
  EXPECT_EQ(doc.referenceCount(), 16u);
}

TEST(DecodeContainers, TupleKey) {
  const auto doc = Decode(Hex("7b a9 02 da 01 61 da 01 62 da 01 63 30"), 4);
  ASSERT_EQ(doc.rootValue().entries().size(), 1u);
  const auto& [k, v] = doc.rootValue().entries()[0];
  ASSERT_EQ(doc.at(k).kind(), Kind::Tuple);
  EXPECT_EQ(doc.at(doc.at(k).elements()[1]).asText(), "b");
  EXPECT_EQ(doc.at(v).asText(), "c");
}

TEST(DecodeContainers, DuplicateDictKeyLastValueWins) {
  // {'a': 1, 'b': 2, 'a': 3}
  const auto doc = Decode(Hex("7b 7a 01 61 69 01 00 00 00 7a 01 62 69 02 00 00 00 7a 01 61 69 03 00 00 00 30"), 4);
  const auto& entries = doc.rootValue().entries();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(doc.at(entries[0].first).asText(), "a");
  EXPECT_EQ(doc.at(entries[0].second).asInt(), 3);
  EXPECT_EQ(doc.at(entries[1].first).asText(), "b");
}

TEST(DecodeContainers, IntAndLongKeysCollide) {
  // {5: 'x', 5L: 'y'} where the second key arrives as a Long
  const auto doc = Decode(Hex("7b 69 05 00 00 00 7a 01 78 6c 01 00 00 00 05 00 7a 01 79 30"), 4);
  ASSERT_EQ(doc.rootValue().entries().size(), 1u);
  EXPECT_EQ(doc.at(doc.rootValue().entries()[0].second).asText(), "y");
}

TEST(DecodeContainers, Sets) {
  const auto set = Decode(Hex(
      "3c 08 00 00 00 da 05 61 6c 69 73 74 da 08 61 62 6f 6f 6c 65 61 6e da 07 61 73 74 72 69 6e "
      "67 da 08 61 75 6e 69 63 6f 64 65 da 06 61 66 6c 6f 61 74 da 05 61 6e 69 6e 74 da 06 61 74 "
      "75 70 6c 65 da 0a 61 73 68 6f 72 74 6c 6f 6e 67"), 4);
  EXPECT_EQ(set.rootValue().kind(), Kind::Set);
  EXPECT_EQ(set.rootValue().elements().size(), 8u);
  const auto frozen = Decode(Hex(
      "3e 08 00 00 00 da 06 61 74 75 70 6c 65 da 08 61 75 6e 69 63 6f 64 65 da 05 61 6e 69 6e 74 "
      "da 08 61 62 6f 6f 6c 65 61 6e da 06 61 66 6c 6f 61 74 da 05 61 6c 69 73 74 da 0a 61 73 68 "
      "6f 72 74 6c 6f 6e 67 da 07 61 73 74 72 69 6e 67"), 4);
  EXPECT_EQ(frozen.rootValue().kind(), Kind::FrozenSet);
  EXPECT_EQ(frozen.rootValue().elements().size(), 8u);
  EXPECT_TRUE(StructurallyEqual(set.arena(), set.root(), set.arena(), set.root()));
}

TEST(DecodeContainers, DuplicateSetElementsCollapse) {
  const auto doc = Decode(Hex("3c 03 00 00 00 69 01 00 00 00 69 02 00 00 00 69 01 00 00 00"), 4);
  const auto& e = doc.rootValue().elements();
  ASSERT_EQ(e.size(), 2u);
  EXPECT_EQ(doc.at(e[0]).asInt(), 1);
  EXPECT_EQ(doc.at(e[1]).asInt(), 2);
}

TEST(DecodeContainers, NestingBelowLimit) {
  for (const char* unit : {"29 01", "28 01 00 00 00", "5b 01 00 00 00", "3e 01 00 00 00"}) {
    const auto blob = testutil::Concat(testutil::Repeat(Hex(unit), 100), Hex("4e"));
    const auto doc = Decode(blob, 4);
    EXPECT_EQ(doc.consumedBytes(), blob.size());
  }
  const auto dicts = testutil::Concat(testutil::Concat(testutil::Repeat(Hex("7b 4e"), 100), Hex("4e")),
                                      testutil::Repeat(Hex("30"), 100));
  EXPECT_EQ(Decode(dicts, 4).consumedBytes(), dicts.size());
}
