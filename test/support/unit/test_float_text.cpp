/***
 * Name: test_float_text
 * Purpose: Legacy decimal float text formatting and parsing.
 */
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "pymarshal/support/float_text.h"

using namespace pymarshal::support;

TEST(FloatText, FormatsWithSeventeenDigits) {
  EXPECT_EQ(FormatFloatText(1.5), "1.5");
  EXPECT_EQ(FormatFloatText(-2.0), "-2");
  EXPECT_EQ(FormatFloatText(0.1), "0.10000000000000001");
}

TEST(FloatText, FormatsSpecials) {
  EXPECT_EQ(FormatFloatText(std::numeric_limits<double>::infinity()), "inf");
  EXPECT_EQ(FormatFloatText(-std::numeric_limits<double>::infinity()), "-inf");
  EXPECT_EQ(FormatFloatText(std::numeric_limits<double>::quiet_NaN()), "nan");
}

TEST(FloatText, ParsesDecimalAndExponent) {
  double d = 0.0;
  ASSERT_TRUE(ParseFloatText("7283.43", d));
  EXPECT_DOUBLE_EQ(d, 7283.43);
  ASSERT_TRUE(ParseFloatText("-1e300", d));
  EXPECT_DOUBLE_EQ(d, -1e300);
  ASSERT_TRUE(ParseFloatText("0.10000000000000001", d));
  EXPECT_EQ(d, 0.1);
}

TEST(FloatText, ParsesSpecialsCaseInsensitively) {
  double d = 0.0;
  ASSERT_TRUE(ParseFloatText("INF", d));
  EXPECT_TRUE(std::isinf(d) && d > 0);
  ASSERT_TRUE(ParseFloatText("-inf", d));
  EXPECT_TRUE(std::isinf(d) && d < 0);
  ASSERT_TRUE(ParseFloatText("nan", d));
  EXPECT_TRUE(std::isnan(d));
}

TEST(FloatText, RejectsMalformedText) {
  double d = 0.0;
  EXPECT_FALSE(ParseFloatText("", d));
  EXPECT_FALSE(ParseFloatText("abc", d));
  EXPECT_FALSE(ParseFloatText("1.5x", d));
  EXPECT_FALSE(ParseFloatText("0x10", d));
  EXPECT_FALSE(ParseFloatText("1 ", d));
}

TEST(FloatText, FormattedTextParsesBack) {
  for (double v : {0.0, -0.0, 1.0 / 3.0, 6.02214076e23, -4.9e-324, 1.7976931348623157e308}) {
    double back = 1.0;
    ASSERT_TRUE(ParseFloatText(FormatFloatText(v), back)) << v;
    EXPECT_EQ(back, v);
    EXPECT_EQ(std::signbit(back), std::signbit(v));
  }
}
