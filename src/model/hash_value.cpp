/***
 * Name: pymarshal::StructuralHasher / HashValue / IsHashable
 * Purpose: Hash codes consistent with StructurallyEqual, and the hashability rule used for
 *   dict keys and set members.
 */
#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>
#include <unordered_set>
#include <vector>

#include <llvm/ADT/Hashing.h>

#include "pymarshal/exceptions/value_error.h"
#include "pymarshal/model/equality.h"

namespace pymarshal {

namespace {

constexpr unsigned kUnfoldLevels = 6;

std::size_t hashDouble(double d) {
  if (std::isnan(d)) { return static_cast<std::size_t>(llvm::hash_value(0x7FF8U)); }
  std::uint64_t bits = 0;
  std::memcpy(&bits, &d, sizeof bits);
  return static_cast<std::size_t>(llvm::hash_value(bits));
}

std::size_t kindHash(Kind kind) {
  return static_cast<std::size_t>(llvm::hash_value(static_cast<unsigned>(kind)));
}

// Combine a node's own payload with the hashes child() yields for its children.
template <typename ChildHash>
std::size_t combineNode(const Value& v, ChildHash&& child) {
  const auto kindTag = static_cast<unsigned>(v.kind());
  switch (v.kind()) {
    case Kind::None:
    case Kind::StopIteration:
    case Kind::Ellipsis:
    case Kind::Unknown:
      return kindHash(v.kind());
    case Kind::Bool: return static_cast<std::size_t>(llvm::hash_combine(kindTag, v.asBool()));
    // Int and Long share one hash space so numerically equal values collide.
    case Kind::Int: return BigInt(v.asInt()).hash();
    case Kind::Long: return v.asLong().hash();
    case Kind::Float: return hashDouble(v.asFloat());
    case Kind::Complex: {
      const Complex c = v.asComplex();
      return static_cast<std::size_t>(
          llvm::hash_combine(kindTag, hashDouble(c.real), hashDouble(c.imag)));
    }
    case Kind::Bytes: return static_cast<std::size_t>(llvm::hash_combine(kindTag, v.asBytes()));
    case Kind::Str: return static_cast<std::size_t>(llvm::hash_combine(kindTag, v.asText()));
    case Kind::Tuple:
    case Kind::List: {
      llvm::hash_code h = llvm::hash_value(kindTag);
      for (ValueId e : v.elements()) { h = llvm::hash_combine(h, child(e)); }
      return static_cast<std::size_t>(h);
    }
    case Kind::Set:
    case Kind::FrozenSet: {
      std::size_t sum = 0;
      for (ValueId e : v.elements()) { sum += child(e); }
      return static_cast<std::size_t>(llvm::hash_combine(kindTag, sum));
    }
    case Kind::Dict: {
      std::size_t sum = 0;
      for (const auto& [k, val] : v.entries()) {
        sum += static_cast<std::size_t>(llvm::hash_combine(child(k), child(val)));
      }
      return static_cast<std::size_t>(llvm::hash_combine(kindTag, sum));
    }
    case Kind::Code: {
      const CodeObject& c = v.code();
      return static_cast<std::size_t>(llvm::hash_combine(kindTag, c.argcount, c.flags,
                                                         c.firstlineno, child(c.code),
                                                         child(c.name)));
    }
  }
  return 0;
}

}  // namespace

StructuralHasher::StructuralHasher(const ObjectArena& arena, std::size_t maxDepth)
    : arena_(arena), max_depth_(maxDepth) {}

std::size_t StructuralHasher::hash(ValueId id) {
  bool cyclic = false;
  const std::size_t h = exact(id, 1, cyclic);
  return cyclic ? unfolded(id, 0) : h;
}

std::size_t StructuralHasher::exact(ValueId id, std::size_t depth, bool& cyclic) {
  const auto found = state_.find(id);
  if (found != state_.end()) {
    if (found->second == State::Exact) { return exact_[id]; }
    cyclic = true;
    return 0;
  }
  if (depth > max_depth_) {
    throw exceptions::ValueError("value nested deeper than " + std::to_string(max_depth_) +
                                 " levels cannot be hashed");
  }
  state_[id] = State::Active;
  bool childCyclic = false;
  const std::size_t h = combineNode(arena_.at(id), [&](ValueId child) {
    return exact(child, depth + 1, childCyclic);
  });
  if (childCyclic) {
    state_[id] = State::Cyclic;
    cyclic = true;
    return 0;
  }
  state_[id] = State::Exact;
  exact_[id] = h;
  return h;
}

std::size_t StructuralHasher::unfolded(ValueId id, unsigned level) {
  const auto state = state_.find(id);
  if (state != state_.end() && state->second == State::Exact) { return exact_[id]; }
  if (level >= kUnfoldLevels) { return kindHash(arena_.at(id).kind()); }
  const std::uint64_t key = (static_cast<std::uint64_t>(id) << 8U) | level;
  const auto memo = unfolded_.find(key);
  if (memo != unfolded_.end()) { return memo->second; }
  const std::size_t h = combineNode(arena_.at(id), [&](ValueId child) {
    return unfolded(child, level + 1);
  });
  unfolded_[key] = h;
  return h;
}

std::size_t HashValue(const ObjectArena& arena, ValueId id, std::size_t maxDepth) {
  StructuralHasher hasher(arena, maxDepth);
  return hasher.hash(id);
}

bool IsHashable(const ObjectArena& arena, ValueId id) {
  std::vector<ValueId> pending{id};
  std::unordered_set<ValueId> seen{id};
  while (!pending.empty()) {
    const Value& v = arena.at(pending.back());
    pending.pop_back();
    switch (v.kind()) {
      case Kind::List:
      case Kind::Dict:
      case Kind::Set:
        return false;
      case Kind::Tuple:
        for (ValueId e : v.elements()) {
          if (seen.insert(e).second) { pending.push_back(e); }
        }
        break;
      default:
        break;
    }
  }
  return true;
}

}  // namespace pymarshal
