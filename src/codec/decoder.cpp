/***
 * Name: pymarshal::codec::Decoder (impl)
 * Purpose: Tag dispatch, reference table and container/code assembly.
 */
#include "pymarshal/codec/decoder.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "pymarshal/bigint/big_int.h"
#include "pymarshal/exceptions/decode_error.h"
#include "pymarshal/exceptions/value_error.h"
#include "pymarshal/format/version.h"
#include "pymarshal/model/equality.h"
#include "pymarshal/model/key_index.h"
#include "pymarshal/support/float_text.h"
#include "pymarshal/support/text.h"

namespace pymarshal::codec {

using exceptions::DecodeError;
using exceptions::ErrorKind;
using format::TypeCode;

Decoder::Decoder(const std::uint8_t* data, std::size_t size, const Options& opts)
    : reader_(data, size), opts_(opts) {}

void Decoder::fail(ErrorKind kind, std::size_t offset, const std::string& detail) const {
  throw DecodeError(kind, offset, detail);
}

Document Decoder::run() {
  const ValueId root = readObject(1);
  return Document(std::move(arena_), root, reader_.position(), refs_.size());
}

std::size_t Decoder::readLength() {
  const std::size_t at = reader_.position();
  const std::int32_t n = reader_.readI32Le();
  if (n < 0) { fail(ErrorKind::InvalidLength, at, "negative length " + std::to_string(n)); }
  return static_cast<std::size_t>(n);
}

std::size_t Decoder::reserveSlot(bool flagged) {
  if (!flagged) { return kNoSlot; }
  refs_.push_back(kInvalidValueId);
  return refs_.size() - 1;
}

void Decoder::fillSlot(std::size_t slot, ValueId id) {
  if (slot != kNoSlot) { refs_[slot] = id; }
}

ValueId Decoder::add(Value v, bool flagged) {
  v.flagged_ = flagged;
  ++objects_;
  return arena_.append(std::move(v));
}

void Decoder::requireKind(ValueId id, Kind kind, const char* field, std::size_t offset) const {
  const Kind actual = arena_.at(id).kind();
  if (actual != kind) {
    fail(ErrorKind::TypeMismatch, offset,
         std::string(field) + " must be " + KindName(kind) + ", found " + KindName(actual));
  }
}

void Decoder::requireHashable(ValueId id, const char* role, std::size_t offset) const {
  if (!IsHashable(arena_, id)) {
    fail(ErrorKind::UnhashableKey, offset,
         std::string(role) + " of kind " + KindName(arena_.at(id).kind()) + " is unhashable");
  }
}

std::size_t Decoder::indexKey(KeyIndex& index, ValueId id, std::size_t position,
                              std::size_t offset) const {
  try {
    return index.findOrInsert(id, position);
  } catch (const exceptions::ValueError& e) {
    fail(ErrorKind::RecursionLimitExceeded, offset, e.what());
  }
}

ValueId Decoder::readObject(std::size_t depth) {
  const std::size_t at = reader_.position();
  const ValueId id = readObjectOrNull(depth);
  if (id == kInvalidValueId) { fail(ErrorKind::UnexpectedNull, at, "null where a value is required"); }
  return id;
}

ValueId Decoder::readObjectOrNull(std::size_t depth) {
  const std::size_t tagOffset = reader_.position();
  if (depth > opts_.max_depth) {
    fail(ErrorKind::RecursionLimitExceeded, tagOffset,
         "nesting deeper than " + std::to_string(opts_.max_depth));
  }
  max_depth_seen_ = std::max(max_depth_seen_, depth);

  const std::uint8_t tag = reader_.readU8();
  const bool flagged = (tag & format::kFlagRef) != 0U;
  const auto maybeCode = format::TypeCodeFromByte(static_cast<std::uint8_t>(tag & format::kTypeMask));
  if (!maybeCode || *maybeCode == TypeCode::Unknown) {
    fail(ErrorKind::UnknownTypeTag, tagOffset, "tag byte " + std::to_string(tag));
  }
  const TypeCode code = *maybeCode;
  if (flagged && opts_.version < format::kVersionReferences) {
    fail(ErrorKind::UnsupportedForVersion, tagOffset,
         "reference flag requires version " + std::to_string(format::kVersionReferences));
  }
  if (!format::IsTypeCodeSupported(code, opts_.version)) {
    fail(ErrorKind::UnsupportedForVersion, tagOffset,
         std::string(format::TypeCodeName(code)) + " is not defined in version " +
             std::to_string(opts_.version));
  }

  switch (code) {
    case TypeCode::Null:
      return kInvalidValueId;
    case TypeCode::None:
    case TypeCode::False:
    case TypeCode::True:
    case TypeCode::StopIteration:
    case TypeCode::Ellipsis:
      return readSingleton(code);
    case TypeCode::Ref:
    case TypeCode::StringRef:
      return readBackreference(tagOffset);
    default:
      break;
  }

  const std::size_t slot = reserveSlot(flagged);
  ValueId id = kInvalidValueId;
  switch (code) {
    case TypeCode::Int:
      id = add(Value::MakeInt(reader_.readI32Le()), flagged);
      break;
    case TypeCode::Int64:
      id = add(Value::MakeInt(reader_.readI64Le()), flagged);
      break;
    case TypeCode::Long:
      id = readLong(tagOffset);
      break;
    case TypeCode::Float:
      id = add(Value::MakeFloat(readTextFloat()), flagged);
      break;
    case TypeCode::BinaryFloat:
      id = add(Value::MakeFloat(reader_.readF64Le()), flagged);
      break;
    case TypeCode::Complex: {
      const double re = readTextFloat();
      const double im = readTextFloat();
      id = add(Value::MakeComplex(Complex{re, im}), flagged);
      break;
    }
    case TypeCode::BinaryComplex: {
      const double re = reader_.readF64Le();
      const double im = reader_.readF64Le();
      id = add(Value::MakeComplex(Complex{re, im}), flagged);
      break;
    }
    case TypeCode::String: {
      const std::size_t n = readLength();
      id = add(Value::MakeBytes(reader_.readString(n)), flagged);
      break;
    }
    case TypeCode::Interned:
    case TypeCode::Unicode:
    case TypeCode::Ascii:
    case TypeCode::AsciiInterned:
      id = readText(code, false);
      break;
    case TypeCode::ShortAscii:
    case TypeCode::ShortAsciiInterned:
      id = readText(code, true);
      break;
    case TypeCode::Tuple:
      return readSequence(Kind::Tuple, readLength(), depth, slot);
    case TypeCode::SmallTuple:
      return readSequence(Kind::Tuple, reader_.readU8(), depth, slot);
    case TypeCode::List:
      return readSequence(Kind::List, readLength(), depth, slot);
    case TypeCode::Set:
      return readSequence(Kind::Set, readLength(), depth, slot);
    case TypeCode::FrozenSet:
      return readSequence(Kind::FrozenSet, readLength(), depth, slot);
    case TypeCode::Dict:
      return readDict(depth, slot);
    case TypeCode::Code:
      id = readCode(depth);
      break;
    default:
      fail(ErrorKind::UnknownTypeTag, tagOffset, "tag byte " + std::to_string(tag));
  }
  arena_.mutableAt(id).flagged_ = flagged;
  fillSlot(slot, id);
  // Before version 3 every interned string is a StringRef target.
  if (code == TypeCode::Interned && opts_.version < format::kVersionReferences) {
    refs_.push_back(id);
  }
  return id;
}

ValueId Decoder::readSingleton(TypeCode code) {
  ValueId* cache = nullptr;
  Value v = Value::MakeNone();
  switch (code) {
    case TypeCode::None: cache = &none_; break;
    case TypeCode::False: cache = &false_; v = Value::MakeBool(false); break;
    case TypeCode::True: cache = &true_; v = Value::MakeBool(true); break;
    case TypeCode::StopIteration: cache = &stop_iteration_; v = Value::MakeStopIteration(); break;
    default: cache = &ellipsis_; v = Value::MakeEllipsis(); break;
  }
  if (*cache == kInvalidValueId) { *cache = add(std::move(v), false); }
  return *cache;
}

ValueId Decoder::readBackreference(std::size_t tagOffset) {
  const std::int32_t index = reader_.readI32Le();
  if (index < 0 || static_cast<std::size_t>(index) >= refs_.size()) {
    fail(ErrorKind::BadBackreference, tagOffset,
         "index " + std::to_string(index) + " with " + std::to_string(refs_.size()) +
             " registered objects");
  }
  const ValueId id = refs_[static_cast<std::size_t>(index)];
  if (id == kInvalidValueId) {
    fail(ErrorKind::BadBackreference, tagOffset,
         "index " + std::to_string(index) + " names an object still being decoded");
  }
  ++backrefs_;
  return id;
}

ValueId Decoder::readLong(std::size_t tagOffset) {
  const std::int32_t n = reader_.readI32Le();
  if (n == std::numeric_limits<std::int32_t>::min()) {
    fail(ErrorKind::InvalidLength, tagOffset, "digit count out of range");
  }
  const bool negative = n < 0;
  const auto count = static_cast<std::size_t>(negative ? -n : n);
  std::vector<std::uint16_t> digits;
  digits.reserve(std::min(count, reader_.remaining() / 2));
  for (std::size_t i = 0; i < count; ++i) {
    const std::size_t at = reader_.position();
    const std::uint16_t d = reader_.readU16Le();
    if (d > BigInt::kDigitMask) {
      fail(ErrorKind::MalformedLong, at, "digit " + std::to_string(d) + " out of range");
    }
    digits.push_back(d);
  }
  if (!digits.empty() && digits.back() == 0) {
    fail(ErrorKind::MalformedLong, reader_.position() - 2, "unnormalized long value");
  }
  return add(Value::MakeLong(BigInt::FromDigits(digits, negative)), false);
}

double Decoder::readTextFloat() {
  const std::size_t at = reader_.position();
  const std::size_t n = reader_.readU8();
  const std::string text = reader_.readString(n);
  double out = 0.0;
  if (!support::ParseFloatText(text, out)) {
    fail(ErrorKind::MalformedFloat, at, "cannot parse float text '" + text + "'");
  }
  return out;
}

ValueId Decoder::readText(TypeCode code, bool shortLength) {
  const std::size_t n = shortLength ? reader_.readU8() : readLength();
  const std::size_t at = reader_.position();
  std::string text = reader_.readString(n);
  const bool ascii = code == TypeCode::Ascii || code == TypeCode::AsciiInterned ||
                     code == TypeCode::ShortAscii || code == TypeCode::ShortAsciiInterned;
  if (ascii ? !support::IsAscii(text) : !support::IsValidUtf8(text)) {
    fail(ErrorKind::InvalidText, at,
         std::string(ascii ? "non-ASCII byte in " : "invalid UTF-8 in ") +
             format::TypeCodeName(code) + " payload");
  }
  const bool interned = code == TypeCode::Interned || code == TypeCode::AsciiInterned ||
                        code == TypeCode::ShortAsciiInterned;
  return add(Value::MakeText(std::move(text), interned), false);
}

ValueId Decoder::readSequence(Kind kind, std::size_t count, std::size_t depth, std::size_t slot) {
  const bool flagged = slot != kNoSlot;
  const ValueId id = add(Value::MakeSequence(kind, {}), flagged);
  fillSlot(slot, id);

  const bool unique = kind == Kind::Set || kind == Kind::FrozenSet;
  Value::Elements elements;
  elements.reserve(std::min(count, reader_.remaining()));
  KeyIndex index(arena_, opts_.max_depth);
  for (std::size_t i = 0; i < count; ++i) {
    const std::size_t at = reader_.position();
    const ValueId e = readObject(depth + 1);
    if (!unique) {
      elements.push_back(e);
      continue;
    }
    requireHashable(e, "set element", at);
    if (indexKey(index, e, elements.size(), at) == elements.size()) { elements.push_back(e); }
  }
  std::get<Value::Elements>(arena_.mutableAt(id).payload_) = std::move(elements);
  return id;
}

ValueId Decoder::readDict(std::size_t depth, std::size_t slot) {
  const bool flagged = slot != kNoSlot;
  const ValueId id = add(Value::MakeDict({}), flagged);
  fillSlot(slot, id);

  Value::Entries entries;
  KeyIndex index(arena_, opts_.max_depth);
  for (;;) {
    const std::size_t at = reader_.position();
    const ValueId key = readObjectOrNull(depth + 1);
    if (key == kInvalidValueId) { break; }
    const ValueId value = readObject(depth + 1);
    requireHashable(key, "dict key", at);
    const std::size_t position = indexKey(index, key, entries.size(), at);
    if (position < entries.size()) {
      entries[position].second = value;
    } else {
      entries.emplace_back(key, value);
    }
  }
  std::get<Value::Entries>(arena_.mutableAt(id).payload_) = std::move(entries);
  return id;
}

std::int32_t Decoder::readCountField() { return reader_.readI32Le(); }

ValueId Decoder::readCodeField(std::size_t depth, const char* field, bool allowBytes) {
  const std::size_t at = reader_.position();
  const ValueId id = readObject(depth + 1);
  const Kind kind = arena_.at(id).kind();
  if (kind != Kind::Str && !(allowBytes && kind == Kind::Bytes)) {
    fail(ErrorKind::TypeMismatch, at,
         std::string(field) + " must be Str, found " + KindName(kind));
  }
  return id;
}

ValueId Decoder::readCode(std::size_t depth) {
  const bool py2 = opts_.code_layout == CodeLayout::Python2;
  CodeObject c;
  c.argcount = static_cast<std::uint32_t>(readCountField());
  if (opts_.code_layout == CodeLayout::Python38) {
    c.posonlyargcount = static_cast<std::uint32_t>(readCountField());
  }
  if (!py2) { c.kwonlyargcount = static_cast<std::uint32_t>(readCountField()); }
  c.nlocals = static_cast<std::uint32_t>(readCountField());
  c.stacksize = static_cast<std::uint32_t>(readCountField());
  c.flags = static_cast<std::uint32_t>(readCountField());

  std::size_t at = reader_.position();
  c.code = readObject(depth + 1);
  requireKind(c.code, Kind::Bytes, "code.co_code", at);
  at = reader_.position();
  c.consts = readObject(depth + 1);
  requireKind(c.consts, Kind::Tuple, "code.co_consts", at);

  const auto nameTuple = [&](const char* field) {
    const std::size_t fieldAt = reader_.position();
    const ValueId id = readObject(depth + 1);
    requireKind(id, Kind::Tuple, field, fieldAt);
    for (ValueId e : arena_.at(id).elements()) {
      const Kind k = arena_.at(e).kind();
      if (k != Kind::Str && !(py2 && k == Kind::Bytes)) {
        fail(ErrorKind::TypeMismatch, fieldAt,
             std::string(field) + " entries must be Str, found " + KindName(k));
      }
    }
    return id;
  };
  c.names = nameTuple("code.co_names");
  c.varnames = nameTuple("code.co_varnames");
  c.freevars = nameTuple("code.co_freevars");
  c.cellvars = nameTuple("code.co_cellvars");
  c.filename = readCodeField(depth, "code.co_filename", py2);
  c.name = readCodeField(depth, "code.co_name", py2);
  c.firstlineno = static_cast<std::uint32_t>(readCountField());
  at = reader_.position();
  c.lnotab = readObject(depth + 1);
  requireKind(c.lnotab, Kind::Bytes, "code.co_lnotab", at);
  return add(Value::MakeCode(c), false);
}

}  // namespace pymarshal::codec
