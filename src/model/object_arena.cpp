/***
 * Name: pymarshal::ObjectArena (impl)
 * Purpose: Append-only node storage with handle validation.
 */
#include "pymarshal/model/object_arena.h"

#include <limits>
#include <string>
#include <utility>

#include "pymarshal/exceptions/value_error.h"
#include "pymarshal/model/equality.h"
#include "pymarshal/model/key_index.h"

namespace pymarshal {

using exceptions::ValueError;

const Value& ObjectArena::at(ValueId id) const {
  if (!contains(id)) {
    throw ValueError("value handle " + std::to_string(id) + " out of range (arena holds " +
                     std::to_string(nodes_.size()) + ")");
  }
  return nodes_[id];
}

Value& ObjectArena::mutableAt(ValueId id) {
  if (!contains(id)) {
    throw ValueError("value handle " + std::to_string(id) + " out of range");
  }
  return nodes_[id];
}

ValueId ObjectArena::append(Value v) {
  if (nodes_.size() >= static_cast<std::size_t>(std::numeric_limits<ValueId>::max())) {
    throw ValueError("arena is full");
  }
  nodes_.push_back(std::move(v));
  return static_cast<ValueId>(nodes_.size() - 1);
}

void ObjectArena::requireExisting(ValueId id, const char* role) const {
  if (!contains(id)) {
    throw ValueError(std::string(role) + " handle " + std::to_string(id) +
                     " does not name an existing value");
  }
}

ValueId ObjectArena::none() { return append(Value::MakeNone()); }
ValueId ObjectArena::boolean(bool v) { return append(Value::MakeBool(v)); }
ValueId ObjectArena::stopIteration() { return append(Value::MakeStopIteration()); }
ValueId ObjectArena::ellipsis() { return append(Value::MakeEllipsis()); }
ValueId ObjectArena::integer(std::int64_t v) { return append(Value::MakeInt(v)); }

ValueId ObjectArena::bigInteger(BigInt v) { return append(Value::MakeLong(std::move(v))); }

ValueId ObjectArena::floating(double v) { return append(Value::MakeFloat(v)); }
ValueId ObjectArena::complex(double real, double imag) {
  return append(Value::MakeComplex(Complex{real, imag}));
}
ValueId ObjectArena::bytes(std::string v) { return append(Value::MakeBytes(std::move(v))); }
ValueId ObjectArena::text(std::string utf8, bool interned) {
  return append(Value::MakeText(std::move(utf8), interned));
}

ValueId ObjectArena::tuple(Value::Elements elements) {
  for (ValueId e : elements) { requireExisting(e, "tuple element"); }
  return append(Value::MakeSequence(Kind::Tuple, std::move(elements)));
}

ValueId ObjectArena::list(Value::Elements elements) {
  for (ValueId e : elements) { requireExisting(e, "list element"); }
  return append(Value::MakeSequence(Kind::List, std::move(elements)));
}

ValueId ObjectArena::dict(Value::Entries entries) {
  for (const auto& [k, v] : entries) {
    requireExisting(k, "dict key");
    requireExisting(v, "dict value");
    if (!IsHashable(*this, k)) {
      throw ValueError(std::string("unhashable dict key of kind ") + KindName(at(k).kind()));
    }
  }
  return append(Value::MakeDict(MergeEntries(*this, entries)));
}

ValueId ObjectArena::set(Value::Elements elements) {
  for (ValueId e : elements) {
    requireExisting(e, "set element");
    if (!IsHashable(*this, e)) {
      throw ValueError(std::string("unhashable set element of kind ") + KindName(at(e).kind()));
    }
  }
  return append(Value::MakeSequence(Kind::Set, UniqueMembers(*this, elements)));
}

ValueId ObjectArena::frozenSet(Value::Elements elements) {
  for (ValueId e : elements) {
    requireExisting(e, "frozenset element");
    if (!IsHashable(*this, e)) {
      throw ValueError(std::string("unhashable frozenset element of kind ") +
                       KindName(at(e).kind()));
    }
  }
  return append(Value::MakeSequence(Kind::FrozenSet, UniqueMembers(*this, elements)));
}

ValueId ObjectArena::code(const CodeObject& code) {
  requireExisting(code.code, "code.code");
  requireExisting(code.consts, "code.consts");
  requireExisting(code.names, "code.names");
  requireExisting(code.varnames, "code.varnames");
  requireExisting(code.freevars, "code.freevars");
  requireExisting(code.cellvars, "code.cellvars");
  requireExisting(code.filename, "code.filename");
  requireExisting(code.name, "code.name");
  requireExisting(code.lnotab, "code.lnotab");
  return append(Value::MakeCode(code));
}

ValueId ObjectArena::unknown() { return append(Value::MakeUnknown()); }

}  // namespace pymarshal
