/***
 * Name: pymarshal::ObjectArena
 * Purpose: Owning store for every node of one object graph.
 * Inputs: Values appended through the typed builders
 * Outputs: Stable ValueId handles and const access to nodes
 * Theory of Operation:
 *   Nodes live in a vector and are addressed by index; the arena is released as a unit.
 *   Public builders require every child handle to exist already, so graphs built by
 *   callers are acyclic. Only the decoder may reserve a container before its children
 *   exist and fill it afterwards, which is how self-referencing input becomes a cycle
 *   of indices rather than a cycle of owners.
 *   dict, set and frozenSet collapse structurally equal keys the way decoding does: a
 *   dict keeps the first key's position with the last value, a set keeps the first member.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "pymarshal/model/value.h"

namespace pymarshal {

class ObjectArena {
 public:
  const Value& at(ValueId id) const;
  bool contains(ValueId id) const noexcept { return id < nodes_.size(); }
  std::size_t size() const noexcept { return nodes_.size(); }

  ValueId none();
  ValueId boolean(bool v);
  ValueId stopIteration();
  ValueId ellipsis();
  ValueId integer(std::int64_t v);
  ValueId bigInteger(BigInt v);
  ValueId floating(double v);
  ValueId complex(double real, double imag);
  ValueId bytes(std::string v);
  /*** text: UTF-8 text; validity is checked when encoding, not here. */
  ValueId text(std::string utf8, bool interned = false);
  ValueId tuple(Value::Elements elements);
  ValueId list(Value::Elements elements);
  ValueId dict(Value::Entries entries);
  ValueId set(Value::Elements elements);
  ValueId frozenSet(Value::Elements elements);
  ValueId code(const CodeObject& code);
  ValueId unknown();

 private:
  friend class codec::Decoder;

  ValueId append(Value v);
  Value& mutableAt(ValueId id);
  void requireExisting(ValueId id, const char* role) const;

  std::vector<Value> nodes_;
};

}  // namespace pymarshal
