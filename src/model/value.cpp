/***
 * Name: pymarshal::Value (impl)
 * Purpose: Kind-checked accessors and factories.
 */
#include "pymarshal/model/value.h"

#include <string>
#include <utility>

#include "pymarshal/exceptions/value_error.h"

namespace pymarshal {

using exceptions::ValueError;

void Value::expect(Kind kind) const {
  if (kind_ != kind) {
    throw ValueError(std::string("expected ") + KindName(kind) + " value, found " +
                     KindName(kind_));
  }
}

bool Value::asBool() const {
  expect(Kind::Bool);
  return std::get<bool>(payload_);
}

std::int64_t Value::asInt() const {
  expect(Kind::Int);
  return std::get<std::int64_t>(payload_);
}

const BigInt& Value::asLong() const {
  expect(Kind::Long);
  return std::get<BigInt>(payload_);
}

double Value::asFloat() const {
  expect(Kind::Float);
  return std::get<double>(payload_);
}

Complex Value::asComplex() const {
  expect(Kind::Complex);
  return std::get<Complex>(payload_);
}

const std::string& Value::asBytes() const {
  expect(Kind::Bytes);
  return std::get<std::string>(payload_);
}

const std::string& Value::asText() const {
  expect(Kind::Str);
  return std::get<std::string>(payload_);
}

const Value::Elements& Value::elements() const {
  switch (kind_) {
    case Kind::Tuple:
    case Kind::List:
    case Kind::Set:
    case Kind::FrozenSet:
      return std::get<Elements>(payload_);
    default:
      throw ValueError(std::string("expected a sequence value, found ") + KindName(kind_));
  }
}

const Value::Entries& Value::entries() const {
  expect(Kind::Dict);
  return std::get<Entries>(payload_);
}

const CodeObject& Value::code() const {
  expect(Kind::Code);
  return std::get<CodeObject>(payload_);
}

Value Value::MakeNone() { return Value(Kind::None, std::monostate{}); }
Value Value::MakeBool(bool v) { return Value(Kind::Bool, v); }
Value Value::MakeStopIteration() { return Value(Kind::StopIteration, std::monostate{}); }
Value Value::MakeEllipsis() { return Value(Kind::Ellipsis, std::monostate{}); }
Value Value::MakeInt(std::int64_t v) { return Value(Kind::Int, v); }
Value Value::MakeLong(BigInt v) { return Value(Kind::Long, std::move(v)); }
Value Value::MakeFloat(double v) { return Value(Kind::Float, v); }
Value Value::MakeComplex(Complex v) { return Value(Kind::Complex, v); }
Value Value::MakeBytes(std::string v) { return Value(Kind::Bytes, std::move(v)); }

Value Value::MakeText(std::string utf8, bool interned) {
  Value v(Kind::Str, std::move(utf8));
  v.interned_ = interned;
  return v;
}

Value Value::MakeSequence(Kind kind, Elements elements) {
  switch (kind) {
    case Kind::Tuple:
    case Kind::List:
    case Kind::Set:
    case Kind::FrozenSet:
      return Value(kind, std::move(elements));
    default:
      throw ValueError(std::string("not a sequence kind: ") + KindName(kind));
  }
}

Value Value::MakeDict(Entries entries) { return Value(Kind::Dict, std::move(entries)); }
Value Value::MakeCode(CodeObject code) { return Value(Kind::Code, code); }
Value Value::MakeUnknown() { return Value(Kind::Unknown, std::monostate{}); }

}  // namespace pymarshal
