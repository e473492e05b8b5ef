/***
 * Name: pymarshal::KeyIndex
 * Purpose: Detect structurally equal dict keys and set members while a container is built.
 * Inputs: The arena holding the keys; keys must be hashable and complete when indexed
 * Outputs: The position of the first equal key, or the position just recorded
 * Theory of Operation: Keys are bucketed by StructuralHasher and confirmed with
 *   StructurallyEqual, so the decoder and the arena builders collapse duplicates the
 *   same way. ValueError propagates when a key is nested deeper than maxDepth.
 */
#pragma once

#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

#include "pymarshal/format/options.h"
#include "pymarshal/model/equality.h"
#include "pymarshal/model/object_arena.h"

namespace pymarshal {

class KeyIndex {
 public:
  explicit KeyIndex(const ObjectArena& arena, std::size_t maxDepth = kDefaultMaxDepth);

  /*** findOrInsert: Position of an earlier key equal to id, else record id at position. */
  std::size_t findOrInsert(ValueId id, std::size_t position);

 private:
  const ObjectArena& arena_;
  std::size_t max_depth_;
  StructuralHasher hasher_;
  std::unordered_map<std::size_t, std::vector<std::pair<ValueId, std::size_t>>> buckets_;
};

/*** UniqueMembers: First occurrence of each member, in order. */
Value::Elements UniqueMembers(const ObjectArena& arena, const Value::Elements& members);

/*** MergeEntries: First position of each key, carrying the last value given for it. */
Value::Entries MergeEntries(const ObjectArena& arena, const Value::Entries& entries);

}  // namespace pymarshal
