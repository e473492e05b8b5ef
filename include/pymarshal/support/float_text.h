/***
 * Name: pymarshal::support (float_text)
 * Purpose: Decimal text form of doubles used by the legacy float and complex tags.
 * Inputs: A double to format, or text to parse
 * Outputs: Text of at most 255 bytes; parsed double plus success flag
 * Theory of Operation: Formatting uses 17 significant digits ("%.17g"), which always
 *   round-trips an IEEE-754 double. Parsing accepts the special spellings
 *   inf, -inf and nan and hands everything else to llvm::APFloat
 *   with round-to-nearest-even, rejecting inexact syntax errors rather than guessing.
 */
#pragma once

#include <string>
#include <string_view>

namespace pymarshal {
namespace support {

std::string FormatFloatText(double value);

/*** ParseFloatText: Parse decimal text into out; return false on malformed text. */
bool ParseFloatText(std::string_view text, double& out);

}  // namespace support
}  // namespace pymarshal
