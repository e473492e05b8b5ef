/***
 * Name: pymarshal (equality)
 * Purpose: Structural comparison and hashing of arena values.
 * Inputs: Arenas, handles and a traversal depth limit
 * Outputs: Equality booleans, hash codes, hashability checks
 * Theory of Operation:
 *   StructurallyEqual walks both graphs in parallel, assuming equality for any pair of
 *   handles already under comparison so cycles terminate. Pairs proven equal are reused
 *   for the rest of the walk (and dropped again if an assumption they rested on fails);
 *   pairs proven unequal are final. Unordered members are matched only within equal
 *   hash buckets. Int and Long compare numerically; floats compare by value with NaN
 *   equal to NaN and +0.0 distinct from -0.0; Dict, Set and FrozenSet ignore order;
 *   interned-ness and wire flags are ignored.
 *   StructuralHasher memoizes one hash per node. Values whose reachable graph is acyclic
 *   get an exact structural hash; values that reach a cycle hash a bounded unfolding, so
 *   equal cyclic values still agree. Both walks throw ValueError past maxDepth levels.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>

#include "pymarshal/format/options.h"
#include "pymarshal/model/document.h"
#include "pymarshal/model/object_arena.h"

namespace pymarshal {

bool StructurallyEqual(const ObjectArena& lhs, ValueId a, const ObjectArena& rhs, ValueId b,
                       std::size_t maxDepth = kDefaultMaxDepth);
bool StructurallyEqual(const Document& lhs, const Document& rhs);

/*** IsHashable: False for List, Dict, Set and for tuples containing any of them. */
bool IsHashable(const ObjectArena& arena, ValueId id);

std::size_t HashValue(const ObjectArena& arena, ValueId id, std::size_t maxDepth = kDefaultMaxDepth);

/***
 * Name: pymarshal::StructuralHasher
 * Purpose: Hash many values of one arena, sharing work between them.
 * Inputs: An arena that is not modified while the hasher is in use
 * Outputs: Hash codes consistent with StructurallyEqual
 */
class StructuralHasher {
 public:
  explicit StructuralHasher(const ObjectArena& arena, std::size_t maxDepth = kDefaultMaxDepth);

  std::size_t hash(ValueId id);

 private:
  enum class State : std::uint8_t { Active, Exact, Cyclic };

  std::size_t exact(ValueId id, std::size_t depth, bool& cyclic);
  std::size_t unfolded(ValueId id, unsigned level);

  const ObjectArena& arena_;
  std::size_t max_depth_;
  std::unordered_map<ValueId, State> state_;
  std::unordered_map<ValueId, std::size_t> exact_;
  std::unordered_map<std::uint64_t, std::size_t> unfolded_;
};

}  // namespace pymarshal
