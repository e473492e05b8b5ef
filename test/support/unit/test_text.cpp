/***
 * Name: test_text
 * Purpose: Strict UTF-8 and ASCII validation.
 */
#include <gtest/gtest.h>
#include <string>
#include "pymarshal/support/text.h"

using namespace pymarshal::support;

TEST(Text, AcceptsWellFormedUtf8) {
  EXPECT_TRUE(IsValidUtf8(""));
  EXPECT_TRUE(IsValidUtf8("plain ascii"));
  EXPECT_TRUE(IsValidUtf8("Andr\xc3\xa8 Previn"));
  EXPECT_TRUE(IsValidUtf8("\xe2\x82\xac"));
  EXPECT_TRUE(IsValidUtf8("\xf0\x9f\x98\x80"));
}

TEST(Text, RejectsMalformedUtf8) {
  EXPECT_FALSE(IsValidUtf8("\xff"));
  EXPECT_FALSE(IsValidUtf8("\xc3"));
  EXPECT_FALSE(IsValidUtf8("Andr\xe8 Previn"));
  // Overlong '/'
  EXPECT_FALSE(IsValidUtf8("\xc0\xaf"));
  // Encoded surrogate U+D800
  EXPECT_FALSE(IsValidUtf8("\xed\xa0\x80"));
  // Beyond U+10FFFF
  EXPECT_FALSE(IsValidUtf8("\xf4\x90\x80\x80"));
}

TEST(Text, EmbeddedNulIsValid) {
  const std::string s("a\0b", 3);
  EXPECT_TRUE(IsValidUtf8(s));
  EXPECT_TRUE(IsAscii(s));
}

TEST(Text, AsciiCheck) {
  EXPECT_TRUE(IsAscii(""));
  EXPECT_TRUE(IsAscii("abc~\x7f"));
  EXPECT_FALSE(IsAscii("\xc3\xa8"));
}
