/***
 * Name: pymarshal::Document
 * Purpose: Result of one decode call: the arena, the root handle and call statistics.
 * Inputs: Produced by Decode
 * Outputs: Read-only access to the decoded graph
 * Theory of Operation: Owns its arena by value; moving the document moves the graph.
 */
#pragma once

#include <cstddef>
#include <utility>

#include "pymarshal/model/object_arena.h"

namespace pymarshal {

class Document {
 public:
  Document(ObjectArena arena, ValueId root, std::size_t consumed, std::size_t references)
      : arena_(std::move(arena)), root_(root), consumed_(consumed), references_(references) {}

  const ObjectArena& arena() const noexcept { return arena_; }
  ValueId root() const noexcept { return root_; }
  const Value& rootValue() const { return arena_.at(root_); }
  const Value& at(ValueId id) const { return arena_.at(id); }
  /*** consumedBytes: Input bytes used by the top-level value; trailing data is ignored. */
  std::size_t consumedBytes() const noexcept { return consumed_; }
  /*** referenceCount: Final length of the reference table. */
  std::size_t referenceCount() const noexcept { return references_; }

 private:
  ObjectArena arena_;
  ValueId root_;
  std::size_t consumed_;
  std::size_t references_;
};

}  // namespace pymarshal
