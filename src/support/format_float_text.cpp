/***
 * Name: pymarshal::support::FormatFloatText
 * Purpose: Render a double as legacy marshal float text.
 * Inputs: value
 * Outputs: "inf", "-inf", "nan" for specials, otherwise "%.17g"
 */
#include "pymarshal/support/float_text.h"

#include <cmath>
#include <cstdio>
#include <string>

namespace pymarshal::support {

std::string FormatFloatText(double value) {
  if (std::isnan(value)) { return "nan"; }
  if (std::isinf(value)) { return value > 0 ? "inf" : "-inf"; }
  constexpr int kBufSize = 32;
  char buf[kBufSize];
  const int n = std::snprintf(buf, sizeof(buf), "%.17g", value);
  return std::string(buf, n > 0 ? static_cast<std::size_t>(n) : 0U);
}

}  // namespace pymarshal::support
