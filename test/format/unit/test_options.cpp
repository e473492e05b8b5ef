/***
 * Name: test_options
 * Purpose: Option defaults and validation.
 */
#include <gtest/gtest.h>
#include "pymarshal/exceptions/config_error.h"
#include "pymarshal/format/options.h"

using namespace pymarshal;

TEST(Options, Defaults) {
  const Options o;
  EXPECT_EQ(o.version, 4);
  EXPECT_EQ(o.code_layout, CodeLayout::Python38);
  EXPECT_EQ(o.max_depth, 2000u);
  EXPECT_EQ(o.metrics, nullptr);
  EXPECT_NO_THROW(ValidateOptions(o));
  EXPECT_EQ(OptionsForVersion(2).version, 2);
}

TEST(Options, RejectsOutOfRange) {
  EXPECT_THROW(ValidateOptions(OptionsForVersion(-1)), exceptions::ConfigError);
  EXPECT_THROW(ValidateOptions(OptionsForVersion(5)), exceptions::ConfigError);
  Options o;
  o.max_depth = 0;
  EXPECT_THROW(ValidateOptions(o), exceptions::ConfigError);
  o.max_depth = kMaxDepthCeiling + 1;
  EXPECT_THROW(ValidateOptions(o), exceptions::ConfigError);
  o.max_depth = kMaxDepthCeiling;
  EXPECT_NO_THROW(ValidateOptions(o));
}
