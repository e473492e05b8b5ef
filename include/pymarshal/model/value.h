/***
 * Name: pymarshal::Value
 * Purpose: One immutable node of the decoded object graph.
 * Inputs: Built through ObjectArena factory functions or by the decoder
 * Outputs: Kind plus typed accessors
 * Theory of Operation:
 *   A Kind tag and a std::variant payload. Children of containers and code objects are
 *   ValueIds into the same arena, so shared and self-referencing graphs need no owning
 *   pointers. Accessors check the kind and throw ValueError on mismatch.
 *   wireFlagged() records whether the decoder saw the reference flag on this node's tag;
 *   the encoder uses it to reproduce the incoming flag placement.
 */
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "pymarshal/bigint/big_int.h"
#include "pymarshal/model/code_object.h"
#include "pymarshal/model/kind.h"
#include "pymarshal/model/value_id.h"

namespace pymarshal {

namespace codec {
class Decoder;
}

struct Complex {
  double real{0.0};
  double imag{0.0};
};

class Value {
 public:
  using Elements = std::vector<ValueId>;
  using Entries = std::vector<std::pair<ValueId, ValueId>>;

  Kind kind() const noexcept { return kind_; }
  bool isInterned() const noexcept { return interned_; }
  bool wireFlagged() const noexcept { return flagged_; }

  bool asBool() const;
  std::int64_t asInt() const;
  const BigInt& asLong() const;
  double asFloat() const;
  Complex asComplex() const;
  /*** asBytes / asText: Raw payload of Bytes and Str (UTF-8) values respectively. */
  const std::string& asBytes() const;
  const std::string& asText() const;
  /*** elements: Members of Tuple, List, Set and FrozenSet. */
  const Elements& elements() const;
  /*** entries: Key/value handles of a Dict in insertion order. */
  const Entries& entries() const;
  const CodeObject& code() const;

  static Value MakeNone();
  static Value MakeBool(bool v);
  static Value MakeStopIteration();
  static Value MakeEllipsis();
  static Value MakeInt(std::int64_t v);
  static Value MakeLong(BigInt v);
  static Value MakeFloat(double v);
  static Value MakeComplex(Complex v);
  static Value MakeBytes(std::string v);
  static Value MakeText(std::string utf8, bool interned);
  static Value MakeSequence(Kind kind, Elements elements);
  static Value MakeDict(Entries entries);
  static Value MakeCode(CodeObject code);
  static Value MakeUnknown();

 private:
  friend class codec::Decoder;
  using Payload = std::variant<std::monostate, bool, std::int64_t, BigInt, double, Complex,
                               std::string, Elements, Entries, CodeObject>;

  Value(Kind kind, Payload payload) : kind_(kind), payload_(std::move(payload)) {}
  void expect(Kind kind) const;

  Kind kind_;
  bool interned_{false};
  bool flagged_{false};
  Payload payload_;
};

}  // namespace pymarshal
