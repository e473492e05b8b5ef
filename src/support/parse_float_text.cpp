/***
 * Name: pymarshal::support::ParseFloatText
 * Purpose: Parse legacy marshal float text.
 * Inputs:
 *   - text: decimal or special spelling
 * Outputs:
 *   - out: parsed value on success
 *   - returns false on empty or malformed text
 * Theory of Operation: Specials are matched case-insensitively with an optional sign;
 *   decimal text goes through llvm::APFloat so rounding matches IEEE round-to-nearest.
 */
#include "pymarshal/support/float_text.h"

#include <llvm/ADT/APFloat.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <cctype>
#include <limits>
#include <string>

namespace pymarshal::support {

static std::string ToLowerAscii(std::string_view text) {
  std::string out(text);
  for (auto& c : out) { c = static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
  return out;
}

static bool ParseSpecial(std::string_view text, double& out) {
  bool negative = false;
  if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
    negative = text[0] == '-';
    text.remove_prefix(1);
  }
  const std::string lower = ToLowerAscii(text);
  if (lower == "inf" || lower == "infinity") {
    out = negative ? -std::numeric_limits<double>::infinity()
                   : std::numeric_limits<double>::infinity();
    return true;
  }
  if (lower == "nan") {
    out = negative ? -std::numeric_limits<double>::quiet_NaN()
                   : std::numeric_limits<double>::quiet_NaN();
    return true;
  }
  return false;
}

bool ParseFloatText(std::string_view text, double& out) {
  if (text.empty()) { return false; }
  if (ParseSpecial(text, out)) { return true; }
  for (const char c : text) {
    const bool ok = (std::isdigit(static_cast<unsigned char>(c)) != 0) || c == '.' || c == 'e' ||
                    c == 'E' || c == '+' || c == '-';
    if (!ok) { return false; }
  }
  llvm::APFloat value(llvm::APFloat::IEEEdouble());
  auto status = value.convertFromString(llvm::StringRef(text.data(), text.size()),
                                        llvm::APFloat::rmNearestTiesToEven);
  if (!status) {
    llvm::consumeError(status.takeError());
    return false;
  }
  out = value.convertToDouble();
  return true;
}

}  // namespace pymarshal::support
