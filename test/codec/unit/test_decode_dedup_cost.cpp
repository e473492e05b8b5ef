/***
 * Name: test_decode_dedup_cost
 * Purpose: Set and dict dedup over shared, cyclic and deeply nested members finishes quickly
 *   and collapses members that are equal.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <vector>
#include "pymarshal/codec/marshal.h"
#include "pymarshal/exceptions/decode_error.h"
#include "../../util/Bytes.h"

using namespace pymarshal;
using exceptions::DecodeError;
using exceptions::ErrorKind;
using testutil::Concat;
using testutil::Hex;
using testutil::Repeat;
using testutil::U32;

namespace {

constexpr auto kBudget = std::chrono::seconds(5);

Document timedDecode(const std::vector<std::uint8_t>& blob, std::chrono::milliseconds& took) {
  const auto start = std::chrono::steady_clock::now();
  Document doc = Decode(blob, 4);
  took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
  return doc;
}

// Flagged 255-element tuple whose every element refers back to the tuple itself.
std::vector<std::uint8_t> selfFanOut(std::uint32_t slot) {
  return Concat(Hex("a9 ff"), Repeat(Concat(Hex("72"), U32(slot)), 255));
}

// T_0 = (None,), T_k = (T_{k-1}, T_{k-1}) with the second element sent as a back reference.
std::vector<std::uint8_t> sharedChain(unsigned k, std::uint32_t slot) {
  if (k == 0) { return Hex("a9 01 4e"); }
  auto out = Concat(Hex("a9 02"), sharedChain(k - 1, slot + 1));
  out = Concat(out, Hex("72"));
  return Concat(out, U32(slot + 1));
}

}  // namespace

TEST(DecodeDedupCost, SelfReferentialFanOut) {
  std::chrono::milliseconds took{};
  const auto doc = timedDecode(Concat(Hex("3e 01 00 00 00"), selfFanOut(0)), took);
  EXPECT_LT(took, kBudget);
  ASSERT_EQ(doc.rootValue().kind(), Kind::FrozenSet);
  EXPECT_EQ(doc.rootValue().elements().size(), 1u);
}

TEST(DecodeDedupCost, EquivalentCyclicMembersCollapse) {
  std::chrono::milliseconds took{};
  const auto doc = timedDecode(Concat(Concat(Hex("3e 02 00 00 00"), selfFanOut(0)), selfFanOut(1)), took);
  EXPECT_LT(took, kBudget);
  EXPECT_EQ(doc.rootValue().elements().size(), 1u);
  EXPECT_EQ(doc.referenceCount(), 2u);
}

TEST(DecodeDedupCost, EqualSharedChainsCollapse) {
  constexpr unsigned kLevels = 40;
  std::chrono::milliseconds took{};
  const auto blob = Concat(Concat(Hex("3e 02 00 00 00"), sharedChain(kLevels, 0)),
                           sharedChain(kLevels, kLevels + 1));
  const auto doc = timedDecode(blob, took);
  EXPECT_LT(took, kBudget);
  EXPECT_EQ(doc.rootValue().elements().size(), 1u);
  EXPECT_EQ(doc.referenceCount(), 2 * (kLevels + 1));
}

TEST(DecodeDedupCost, ManyDeepDistinctMembers) {
  constexpr std::uint32_t kMembers = 20000;
  auto blob = Concat(Hex("3c"), U32(kMembers));
  for (std::uint32_t i = 0; i < kMembers; ++i) {
    blob = Concat(blob, Repeat(Hex("29 01"), 8));
    blob = Concat(blob, Concat(Hex("69"), U32(i)));
  }
  std::chrono::milliseconds took{};
  const auto doc = timedDecode(blob, took);
  EXPECT_LT(took, kBudget);
  EXPECT_EQ(doc.rootValue().elements().size(), kMembers);
}

TEST(DecodeDedupCost, DeepKeyBuiltFromReferencesHitsDepthLimit) {
  // A list of T_0 = (None,) and T_k = (T_{k-1},), then a frozenset holding T_19.
  auto blob = Concat(Hex("5b"), U32(21));
  blob = Concat(blob, Hex("a9 01 4e"));
  for (std::uint32_t k = 1; k < 20; ++k) { blob = Concat(blob, Concat(Hex("a9 01 72"), U32(k - 1))); }
  blob = Concat(blob, Concat(Hex("3e 01 00 00 00 72"), U32(19)));
  Options opts = OptionsForVersion(4);
  opts.max_depth = 10;
  try {
    Decode(blob, opts);
    ADD_FAILURE() << "decode unexpectedly succeeded";
  } catch (const DecodeError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::RecursionLimitExceeded);
  }
  opts.max_depth = 64;
  const auto doc = Decode(blob, opts);
  EXPECT_EQ(doc.rootValue().elements().size(), 21u);
}
