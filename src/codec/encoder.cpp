/***
 * Name: pymarshal::codec::Encoder (impl)
 * Purpose: Tag selection, reference assignment and payload writers.
 */
#include "pymarshal/codec/encoder.h"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "pymarshal/bigint/big_int.h"
#include "pymarshal/exceptions/encode_error.h"
#include "pymarshal/exceptions/value_error.h"
#include "pymarshal/format/version.h"
#include "pymarshal/support/float_text.h"
#include "pymarshal/support/text.h"

namespace pymarshal::codec {

using exceptions::EncodeError;
using exceptions::ErrorKind;
using format::TypeCode;

namespace {
constexpr std::size_t kMaxLength = static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max());
constexpr std::size_t kShortLimit = 256;

bool fitsInt32(std::int64_t v) {
  return v >= std::numeric_limits<std::int32_t>::min() && v <= std::numeric_limits<std::int32_t>::max();
}
} // namespace

Encoder::Encoder(const ObjectArena& arena, const Options& opts) : arena_(arena), opts_(opts) {}

void Encoder::fail(ErrorKind kind, const std::string& detail) const {
  throw EncodeError(kind, writer_.size(), detail);
}

std::size_t Encoder::referenceCount() const noexcept {
  return opts_.version >= format::kVersionReferences ? slots_.size() : interned_.size();
}

std::vector<std::uint8_t> Encoder::run(ValueId root) {
  if (!arena_.contains(root)) {
    throw exceptions::ValueError("root handle " + std::to_string(root) + " is not in the arena");
  }
  if (opts_.version >= format::kVersionReferences) { countIncomingEdges(root); }
  writeObject(root, 1);
  return writer_.take();
}

void Encoder::countIncomingEdges(ValueId root) {
  incoming_.assign(arena_.size(), 0);
  std::vector<ValueId> pending{root};
  incoming_[root] = 1;
  const auto reach = [&](ValueId child) {
    if (!arena_.contains(child)) { return; }
    if (incoming_[child]++ == 0) { pending.push_back(child); }
  };
  while (!pending.empty()) {
    const ValueId id = pending.back();
    pending.pop_back();
    const Value& v = arena_.at(id);
    switch (v.kind()) {
      case Kind::Tuple:
      case Kind::List:
      case Kind::Set:
      case Kind::FrozenSet:
        for (ValueId e : v.elements()) { reach(e); }
        break;
      case Kind::Dict:
        for (const auto& [k, val] : v.entries()) {
          reach(k);
          reach(val);
        }
        break;
      case Kind::Code: {
        const CodeObject& c = v.code();
        for (ValueId f : {c.code, c.consts, c.names, c.varnames, c.freevars, c.cellvars,
                          c.filename, c.name, c.lnotab}) {
          reach(f);
        }
        break;
      }
      default:
        break;
    }
  }
}

bool Encoder::shouldFlag(ValueId id, const Value& v) const {
  if (opts_.version < format::kVersionReferences || IsSingletonKind(v.kind())) { return false; }
  return v.wireFlagged() || (id < incoming_.size() && incoming_[id] > 1);
}

void Encoder::writeTag(TypeCode code, bool flagged) { writer_.writeU8(format::TagByte(code, flagged)); }

void Encoder::writeLength(std::size_t n, const char* what) {
  if (n > kMaxLength) {
    fail(ErrorKind::InvalidLength, std::string(what) + " length " + std::to_string(n) +
                                       " exceeds the 32-bit limit");
  }
  writer_.writeI32Le(static_cast<std::int32_t>(n));
}

void Encoder::writeObject(ValueId id, std::size_t depth) {
  if (depth > opts_.max_depth) {
    fail(ErrorKind::RecursionLimitExceeded, "nesting deeper than " + std::to_string(opts_.max_depth));
  }
  const Value& v = arena_.at(id);

  if (opts_.version >= format::kVersionReferences) {
    const auto found = slots_.find(id);
    if (found != slots_.end()) {
      writeTag(TypeCode::Ref, false);
      writer_.writeU32Le(found->second);
      ++backrefs_;
      return;
    }
  }

  const bool flagged = shouldFlag(id, v);
  if (flagged) {
    const auto slot = static_cast<std::uint32_t>(slots_.size());
    slots_.emplace(id, slot);
  }
  ++objects_;

  switch (v.kind()) {
    case Kind::None: writeTag(TypeCode::None, false); return;
    case Kind::Bool: writeTag(v.asBool() ? TypeCode::True : TypeCode::False, false); return;
    case Kind::StopIteration: writeTag(TypeCode::StopIteration, false); return;
    case Kind::Ellipsis: writeTag(TypeCode::Ellipsis, false); return;
    case Kind::Int:
      if (fitsInt32(v.asInt())) {
        writeTag(TypeCode::Int, flagged);
        writer_.writeI32Le(static_cast<std::int32_t>(v.asInt()));
      } else {
        writeTag(TypeCode::Long, flagged);
        writeLong(BigInt(v.asInt()));
      }
      return;
    case Kind::Long:
      if (v.asLong().fitsInt32()) {
        writeTag(TypeCode::Int, flagged);
        writer_.writeI32Le(static_cast<std::int32_t>(v.asLong().toInt64()));
      } else {
        writeTag(TypeCode::Long, flagged);
        writeLong(v.asLong());
      }
      return;
    case Kind::Float:
      if (opts_.version >= format::kVersionBinaryFloat) {
        writeTag(TypeCode::BinaryFloat, flagged);
        writer_.writeF64Le(v.asFloat());
      } else {
        writeTag(TypeCode::Float, flagged);
        writeFloat(v.asFloat());
      }
      return;
    case Kind::Complex: {
      const Complex c = v.asComplex();
      if (opts_.version >= format::kVersionBinaryFloat) {
        writeTag(TypeCode::BinaryComplex, flagged);
        writer_.writeF64Le(c.real);
        writer_.writeF64Le(c.imag);
      } else {
        writeTag(TypeCode::Complex, flagged);
        writeFloat(c.real);
        writeFloat(c.imag);
      }
      return;
    }
    case Kind::Bytes:
      writeTag(TypeCode::String, flagged);
      writeLength(v.asBytes().size(), "bytes");
      writer_.writeBytes(v.asBytes());
      return;
    case Kind::Str: writeText(v, flagged); return;
    case Kind::Tuple: writeSequence(TypeCode::Tuple, v.elements(), flagged, depth); return;
    case Kind::List: writeSequence(TypeCode::List, v.elements(), flagged, depth); return;
    case Kind::Set: writeSequence(TypeCode::Set, v.elements(), flagged, depth); return;
    case Kind::FrozenSet: writeSequence(TypeCode::FrozenSet, v.elements(), flagged, depth); return;
    case Kind::Dict: writeDict(v.entries(), flagged, depth); return;
    case Kind::Code: writeCode(v.code(), flagged, depth); return;
    case Kind::Unknown: fail(ErrorKind::UnmarshallableValue, "Unknown values have no encoding");
  }
}

void Encoder::writeLong(const BigInt& value) {
  const std::vector<std::uint16_t> digits = value.toDigits();
  if (digits.size() > kMaxLength) { fail(ErrorKind::InvalidLength, "long value too large"); }
  const auto n = static_cast<std::int32_t>(digits.size());
  writer_.writeI32Le(value.isNegative() ? -n : n);
  for (std::uint16_t d : digits) { writer_.writeU16Le(d); }
}

void Encoder::writeFloat(double value) {
  const std::string text = support::FormatFloatText(value);
  writer_.writeU8(static_cast<std::uint8_t>(text.size()));
  writer_.writeBytes(text);
}

void Encoder::writeText(const Value& v, bool flagged) {
  const std::string& text = v.asText();
  if (!support::IsValidUtf8(text)) { fail(ErrorKind::InvalidText, "text is not valid UTF-8"); }
  const bool interned = v.isInterned();

  if (opts_.version >= format::kVersionCompact && support::IsAscii(text)) {
    if (text.size() < kShortLimit) {
      writeTag(interned ? TypeCode::ShortAsciiInterned : TypeCode::ShortAscii, flagged);
      writer_.writeU8(static_cast<std::uint8_t>(text.size()));
    } else {
      writeTag(interned ? TypeCode::AsciiInterned : TypeCode::Ascii, flagged);
      writeLength(text.size(), "text");
    }
    writer_.writeBytes(text);
    return;
  }

  if (interned && opts_.version >= format::kVersionInterning &&
      opts_.version < format::kVersionReferences) {
    const auto found = interned_.find(text);
    if (found != interned_.end()) {
      writeTag(TypeCode::StringRef, false);
      writer_.writeU32Le(found->second);
      ++backrefs_;
      return;
    }
    interned_.emplace(text, static_cast<std::uint32_t>(interned_.size()));
  }

  const bool asInterned = interned && opts_.version >= format::kVersionInterning;
  writeTag(asInterned ? TypeCode::Interned : TypeCode::Unicode, flagged);
  writeLength(text.size(), "text");
  writer_.writeBytes(text);
}

void Encoder::writeSequence(TypeCode code, const Value::Elements& elements, bool flagged,
                            std::size_t depth) {
  if (code == TypeCode::Tuple && opts_.version >= format::kVersionCompact &&
      elements.size() < kShortLimit) {
    writeTag(TypeCode::SmallTuple, flagged);
    writer_.writeU8(static_cast<std::uint8_t>(elements.size()));
  } else {
    writeTag(code, flagged);
    writeLength(elements.size(), format::TypeCodeName(code));
  }
  for (ValueId e : elements) { writeObject(e, depth + 1); }
}

void Encoder::writeDict(const Value::Entries& entries, bool flagged, std::size_t depth) {
  writeTag(TypeCode::Dict, flagged);
  for (const auto& [k, val] : entries) {
    writeObject(k, depth + 1);
    writeObject(val, depth + 1);
  }
  writeTag(TypeCode::Null, false);
}

void Encoder::writeCodeField(ValueId id, Kind kind, bool allowBytes, const char* field,
                             std::size_t depth) {
  const Kind actual = arena_.at(id).kind();
  if (actual != kind && !(allowBytes && actual == Kind::Bytes)) {
    fail(ErrorKind::TypeMismatch,
         std::string(field) + " must be " + KindName(kind) + ", found " + KindName(actual));
  }
  writeObject(id, depth + 1);
}

void Encoder::writeCode(const CodeObject& c, bool flagged, std::size_t depth) {
  const CodeLayout layout = opts_.code_layout;
  const bool py2 = layout == CodeLayout::Python2;
  if (layout != CodeLayout::Python38 && c.posonlyargcount != 0) {
    fail(ErrorKind::UnsupportedForVersion, "code layout has no positional-only argument count");
  }
  if (py2 && c.kwonlyargcount != 0) {
    fail(ErrorKind::UnsupportedForVersion, "code layout has no keyword-only argument count");
  }

  writeTag(TypeCode::Code, flagged);
  writer_.writeU32Le(c.argcount);
  if (layout == CodeLayout::Python38) { writer_.writeU32Le(c.posonlyargcount); }
  if (!py2) { writer_.writeU32Le(c.kwonlyargcount); }
  writer_.writeU32Le(c.nlocals);
  writer_.writeU32Le(c.stacksize);
  writer_.writeU32Le(c.flags);
  writeCodeField(c.code, Kind::Bytes, false, "code.co_code", depth);
  writeCodeField(c.consts, Kind::Tuple, false, "code.co_consts", depth);
  const std::pair<ValueId, const char*> nameFields[] = {{c.names, "code.co_names"},
                                                        {c.varnames, "code.co_varnames"},
                                                        {c.freevars, "code.co_freevars"},
                                                        {c.cellvars, "code.co_cellvars"}};
  for (const auto& [id, field] : nameFields) {
    const Value& names = arena_.at(id);
    if (names.kind() == Kind::Tuple) {
      for (ValueId e : names.elements()) {
        const Kind k = arena_.at(e).kind();
        if (k != Kind::Str && !(py2 && k == Kind::Bytes)) {
          fail(ErrorKind::TypeMismatch,
               std::string(field) + " entries must be Str, found " + KindName(k));
        }
      }
    }
    writeCodeField(id, Kind::Tuple, false, field, depth);
  }
  writeCodeField(c.filename, Kind::Str, py2, "code.co_filename", depth);
  writeCodeField(c.name, Kind::Str, py2, "code.co_name", depth);
  writer_.writeU32Le(c.firstlineno);
  writeCodeField(c.lnotab, Kind::Bytes, false, "code.co_lnotab", depth);
}

}  // namespace pymarshal::codec
