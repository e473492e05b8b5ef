/***
 * Name: pymarshal::KeyIndex (impl)
 * Purpose: Hash-bucketed duplicate detection for dict keys and set members.
 */
#include "pymarshal/model/key_index.h"

namespace pymarshal {

KeyIndex::KeyIndex(const ObjectArena& arena, std::size_t maxDepth)
    : arena_(arena), max_depth_(maxDepth), hasher_(arena, maxDepth) {}

std::size_t KeyIndex::findOrInsert(ValueId id, std::size_t position) {
  auto& bucket = buckets_[hasher_.hash(id)];
  for (const auto& [prior, priorPosition] : bucket) {
    if (StructurallyEqual(arena_, prior, arena_, id, max_depth_)) { return priorPosition; }
  }
  bucket.emplace_back(id, position);
  return position;
}

Value::Elements UniqueMembers(const ObjectArena& arena, const Value::Elements& members) {
  KeyIndex index(arena);
  Value::Elements out;
  out.reserve(members.size());
  for (ValueId m : members) {
    if (index.findOrInsert(m, out.size()) == out.size()) { out.push_back(m); }
  }
  return out;
}

Value::Entries MergeEntries(const ObjectArena& arena, const Value::Entries& entries) {
  KeyIndex index(arena);
  Value::Entries out;
  out.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    const std::size_t position = index.findOrInsert(key, out.size());
    if (position < out.size()) {
      out[position].second = value;
    } else {
      out.emplace_back(key, value);
    }
  }
  return out;
}

}  // namespace pymarshal
