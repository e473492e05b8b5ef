/***
 * Name: pymarshal::BigInt
 * Purpose: Arbitrary-precision signed integer in sign-magnitude form.
 * Inputs: int64 values, decimal text, or marshal base-2^15 digit arrays
 * Outputs: Digit arrays, decimal text, comparisons and hashes
 * Theory of Operation:
 *   The magnitude is an llvm::APInt kept at a canonical width (the active bit count
 *   rounded up to a multiple of 64, never below 64), so equal values always carry equal
 *   widths and compare/hash without re-extension. Zero is never negative.
 *   Marshal digits are little-endian 15-bit groups of the magnitude; the sign travels
 *   separately (as the sign of the digit count on the wire).
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <llvm/ADT/APInt.h>

namespace pymarshal {

class BigInt {
 public:
  static constexpr unsigned kDigitBits = 15;
  static constexpr std::uint16_t kDigitMask = 0x7FFF;

  BigInt();
  explicit BigInt(std::int64_t value);

  /*** FromMagnitude: Build from an unsigned magnitude of any width and a sign. */
  static BigInt FromMagnitude(const llvm::APInt& magnitude, bool negative);
  /*** FromDigits: Build from little-endian 15-bit digits; each digit must be <= kDigitMask. */
  static BigInt FromDigits(const std::vector<std::uint16_t>& digits, bool negative);
  /*** FromDecimal: Parse [+-]?[0-9]+; return false on malformed text. */
  static bool FromDecimal(std::string_view text, BigInt& out);

  /*** toDigits: Minimal little-endian 15-bit digits of the magnitude (empty for zero). */
  std::vector<std::uint16_t> toDigits() const;
  std::string toDecimal() const;

  bool isZero() const { return magnitude_.isZero(); }
  bool isNegative() const noexcept { return negative_; }
  bool fitsInt32() const;
  bool fitsInt64() const;
  /*** toInt64: Value as int64; only meaningful when fitsInt64(). */
  std::int64_t toInt64() const;

  const llvm::APInt& magnitude() const noexcept { return magnitude_; }
  std::size_t hash() const;

  friend bool operator==(const BigInt& lhs, const BigInt& rhs);
  friend bool operator!=(const BigInt& lhs, const BigInt& rhs) { return !(lhs == rhs); }
  friend bool operator<(const BigInt& lhs, const BigInt& rhs);

 private:
  BigInt(llvm::APInt magnitude, bool negative);
  static llvm::APInt Canonical(const llvm::APInt& magnitude);

  llvm::APInt magnitude_;
  bool negative_{false};
};

}  // namespace pymarshal
