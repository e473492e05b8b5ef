/***
 * Name: pymarshal::BigInt (impl)
 * Purpose: Conversions between APInt magnitudes, int64, decimal text and marshal digits.
 */
#include "pymarshal/bigint/big_int.h"

#include <llvm/ADT/Hashing.h>
#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/StringRef.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <utility>

namespace pymarshal {

namespace {
constexpr unsigned kWordBits = 64;

unsigned RoundUpToWord(unsigned bits) {
  const unsigned words = (bits + kWordBits - 1) / kWordBits;
  return (words == 0 ? 1U : words) * kWordBits;
}
}  // namespace

llvm::APInt BigInt::Canonical(const llvm::APInt& magnitude) {
  const unsigned width = RoundUpToWord(magnitude.getActiveBits());
  return magnitude.zextOrTrunc(width);
}

BigInt::BigInt() : magnitude_(kWordBits, 0) {}

BigInt::BigInt(llvm::APInt magnitude, bool negative)
    : magnitude_(Canonical(magnitude)), negative_(negative && !magnitude_.isZero()) {}

// Two's complement negation of INT64_MIN wraps to itself, which is the right magnitude.
BigInt::BigInt(std::int64_t value)
    : magnitude_(kWordBits, value < 0 ? (~static_cast<std::uint64_t>(value) + 1U)
                                      : static_cast<std::uint64_t>(value)),
      negative_(value < 0) {}

BigInt BigInt::FromMagnitude(const llvm::APInt& magnitude, bool negative) {
  return BigInt(magnitude, negative);
}

BigInt BigInt::FromDigits(const std::vector<std::uint16_t>& digits, bool negative) {
  const unsigned width = RoundUpToWord(static_cast<unsigned>(digits.size()) * kDigitBits);
  llvm::APInt magnitude(width, 0);
  for (std::size_t i = 0; i < digits.size(); ++i) {
    magnitude.insertBits(static_cast<std::uint64_t>(digits[i] & kDigitMask),
                         static_cast<unsigned>(i) * kDigitBits, kDigitBits);
  }
  return BigInt(magnitude, negative);
}

bool BigInt::FromDecimal(std::string_view text, BigInt& out) {
  bool negative = false;
  if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
    negative = text[0] == '-';
    text.remove_prefix(1);
  }
  if (text.empty()) { return false; }
  for (const char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) { return false; }
  }
  constexpr std::uint8_t kRadix = 10;
  const llvm::StringRef digits(text.data(), text.size());
  const unsigned bits = llvm::APInt::getBitsNeeded(digits, kRadix);
  out = BigInt(llvm::APInt(bits, digits, kRadix), negative);
  return true;
}

std::vector<std::uint16_t> BigInt::toDigits() const {
  const unsigned active = magnitude_.getActiveBits();
  const unsigned count = (active + kDigitBits - 1) / kDigitBits;
  std::vector<std::uint16_t> digits;
  digits.reserve(count);
  const llvm::APInt wide = magnitude_.zextOrTrunc(RoundUpToWord(count * kDigitBits));
  for (unsigned i = 0; i < count; ++i) {
    digits.push_back(static_cast<std::uint16_t>(wide.extractBitsAsZExtValue(kDigitBits, i * kDigitBits)));
  }
  return digits;
}

std::string BigInt::toDecimal() const {
  llvm::SmallString<64> text;
  magnitude_.toString(text, 10, /*Signed=*/false);
  std::string out;
  if (negative_) { out.push_back('-'); }
  out.append(text.data(), text.size());
  return out;
}

bool BigInt::fitsInt32() const {
  if (!fitsInt64()) { return false; }
  const std::int64_t v = toInt64();
  return v >= std::numeric_limits<std::int32_t>::min() && v <= std::numeric_limits<std::int32_t>::max();
}

bool BigInt::fitsInt64() const {
  const unsigned active = magnitude_.getActiveBits();
  if (active <= 63) { return true; }
  // INT64_MIN has a 64-bit magnitude with only the top bit set.
  return negative_ && active == 64 && magnitude_.countTrailingZeros() == 63;
}

std::int64_t BigInt::toInt64() const {
  const std::uint64_t bits = magnitude_.getLoBits(kWordBits).getZExtValue();
  const std::uint64_t twos = negative_ ? (~bits + 1U) : bits;
  return static_cast<std::int64_t>(twos);
}

std::size_t BigInt::hash() const {
  return static_cast<std::size_t>(llvm::hash_combine(llvm::hash_value(magnitude_), negative_));
}

bool operator==(const BigInt& lhs, const BigInt& rhs) {
  return lhs.negative_ == rhs.negative_ && lhs.magnitude_.getBitWidth() == rhs.magnitude_.getBitWidth() &&
         lhs.magnitude_ == rhs.magnitude_;
}

bool operator<(const BigInt& lhs, const BigInt& rhs) {
  if (lhs.negative_ != rhs.negative_) { return lhs.negative_; }
  const unsigned width = std::max(lhs.magnitude_.getBitWidth(), rhs.magnitude_.getBitWidth());
  const llvm::APInt a = lhs.magnitude_.zextOrTrunc(width);
  const llvm::APInt b = rhs.magnitude_.zextOrTrunc(width);
  return lhs.negative_ ? b.ult(a) : a.ult(b);
}

}  // namespace pymarshal
