/***
 * Name: pymarshal::StructurallyEqual
 * Purpose: Cycle-safe structural equality across two arenas.
 */
#include <cmath>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <llvm/ADT/Hashing.h>

#include "pymarshal/exceptions/value_error.h"
#include "pymarshal/model/equality.h"

namespace pymarshal {

namespace {

class Comparer {
 public:
  Comparer(const ObjectArena& lhs, const ObjectArena& rhs, std::size_t maxDepth)
      : lhs_(lhs), rhs_(rhs), max_depth_(maxDepth), lhs_hasher_(lhs, maxDepth),
        rhs_hasher_(rhs, maxDepth) {}

  bool equal(ValueId a, ValueId b) { return equalAt(a, b, 1); }

 private:
  using Pair = std::pair<ValueId, ValueId>;

  struct PairHash {
    std::size_t operator()(const Pair& p) const noexcept {
      return static_cast<std::size_t>(llvm::hash_combine(p.first, p.second));
    }
  };

  bool equalAt(ValueId a, ValueId b, std::size_t depth) {
    if (&lhs_ == &rhs_ && a == b) { return true; }
    const Pair key(a, b);
    // A pair already under comparison is assumed equal; that is what ends cycles.
    if (active_.count(key) != 0U || proven_.count(key) != 0U) { return true; }
    if (refuted_.count(key) != 0U) { return false; }
    if (depth > max_depth_) {
      throw exceptions::ValueError("values nested deeper than " + std::to_string(max_depth_) +
                                   " levels cannot be compared");
    }
    active_.insert(key);
    const std::size_t mark = proven_log_.size();
    const bool result = compare(lhs_.at(a), rhs_.at(b), depth);
    active_.erase(key);
    if (result) {
      proven_.insert(key);
      proven_log_.push_back(key);
      return true;
    }
    // Anything proven inside this pair may have leaned on it being equal.
    while (proven_log_.size() > mark) {
      proven_.erase(proven_log_.back());
      proven_log_.pop_back();
    }
    refuted_.insert(key);
    return false;
  }

  static bool floatsEqual(double x, double y) {
    if (std::isnan(x) || std::isnan(y)) { return std::isnan(x) && std::isnan(y); }
    return x == y && std::signbit(x) == std::signbit(y);
  }

  static bool integersEqual(const Value& x, const Value& y) {
    if (x.kind() == Kind::Int && y.kind() == Kind::Int) { return x.asInt() == y.asInt(); }
    const BigInt lx = x.kind() == Kind::Int ? BigInt(x.asInt()) : x.asLong();
    const BigInt ly = y.kind() == Kind::Int ? BigInt(y.asInt()) : y.asLong();
    return lx == ly;
  }

  static bool isInteger(Kind k) { return k == Kind::Int || k == Kind::Long; }

  bool orderedEqual(const Value::Elements& xs, const Value::Elements& ys, std::size_t depth) {
    if (xs.size() != ys.size()) { return false; }
    for (std::size_t i = 0; i < xs.size(); ++i) {
      if (!equalAt(xs[i], ys[i], depth + 1)) { return false; }
    }
    return true;
  }

  // Buckets rhs members by hash; equal members always share a bucket.
  template <typename Member, typename KeyOf>
  std::unordered_map<std::size_t, std::vector<std::size_t>> bucketsOf(const std::vector<Member>& ys,
                                                                       KeyOf keyOf) {
    std::unordered_map<std::size_t, std::vector<std::size_t>> buckets;
    for (std::size_t j = 0; j < ys.size(); ++j) { buckets[rhs_hasher_.hash(keyOf(ys[j]))].push_back(j); }
    return buckets;
  }

  bool unorderedEqual(const Value::Elements& xs, const Value::Elements& ys, std::size_t depth) {
    if (xs.size() != ys.size()) { return false; }
    auto buckets = bucketsOf(ys, [](ValueId y) { return y; });
    std::vector<bool> used(ys.size(), false);
    for (ValueId x : xs) {
      const auto bucket = buckets.find(lhs_hasher_.hash(x));
      if (bucket == buckets.end()) { return false; }
      bool found = false;
      for (std::size_t j : bucket->second) {
        if (!used[j] && equalAt(x, ys[j], depth + 1)) {
          used[j] = true;
          found = true;
          break;
        }
      }
      if (!found) { return false; }
    }
    return true;
  }

  bool entriesEqual(const Value::Entries& xs, const Value::Entries& ys, std::size_t depth) {
    if (xs.size() != ys.size()) { return false; }
    auto buckets = bucketsOf(ys, [](const std::pair<ValueId, ValueId>& e) { return e.first; });
    std::vector<bool> used(ys.size(), false);
    for (const auto& [xk, xv] : xs) {
      const auto bucket = buckets.find(lhs_hasher_.hash(xk));
      if (bucket == buckets.end()) { return false; }
      bool found = false;
      for (std::size_t j : bucket->second) {
        if (!used[j] && equalAt(xk, ys[j].first, depth + 1)) {
          if (!equalAt(xv, ys[j].second, depth + 1)) { return false; }
          used[j] = true;
          found = true;
          break;
        }
      }
      if (!found) { return false; }
    }
    return true;
  }

  bool codesEqual(const CodeObject& x, const CodeObject& y, std::size_t depth) {
    if (x.argcount != y.argcount || x.posonlyargcount != y.posonlyargcount ||
        x.kwonlyargcount != y.kwonlyargcount || x.nlocals != y.nlocals ||
        x.stacksize != y.stacksize || x.flags != y.flags || x.firstlineno != y.firstlineno) {
      return false;
    }
    const std::size_t d = depth + 1;
    return equalAt(x.code, y.code, d) && equalAt(x.consts, y.consts, d) &&
           equalAt(x.names, y.names, d) && equalAt(x.varnames, y.varnames, d) &&
           equalAt(x.freevars, y.freevars, d) && equalAt(x.cellvars, y.cellvars, d) &&
           equalAt(x.filename, y.filename, d) && equalAt(x.name, y.name, d) &&
           equalAt(x.lnotab, y.lnotab, d);
  }

  bool compare(const Value& x, const Value& y, std::size_t depth) {
    if (isInteger(x.kind()) && isInteger(y.kind())) { return integersEqual(x, y); }
    if (x.kind() != y.kind()) { return false; }
    switch (x.kind()) {
      case Kind::None:
      case Kind::StopIteration:
      case Kind::Ellipsis:
      case Kind::Unknown:
        return true;
      case Kind::Bool: return x.asBool() == y.asBool();
      case Kind::Int:
      case Kind::Long:
        return integersEqual(x, y);
      case Kind::Float: return floatsEqual(x.asFloat(), y.asFloat());
      case Kind::Complex: {
        const Complex cx = x.asComplex();
        const Complex cy = y.asComplex();
        return floatsEqual(cx.real, cy.real) && floatsEqual(cx.imag, cy.imag);
      }
      case Kind::Bytes: return x.asBytes() == y.asBytes();
      case Kind::Str: return x.asText() == y.asText();
      case Kind::Tuple:
      case Kind::List:
        return orderedEqual(x.elements(), y.elements(), depth);
      case Kind::Set:
      case Kind::FrozenSet:
        return unorderedEqual(x.elements(), y.elements(), depth);
      case Kind::Dict: return entriesEqual(x.entries(), y.entries(), depth);
      case Kind::Code: return codesEqual(x.code(), y.code(), depth);
    }
    return false;
  }

  const ObjectArena& lhs_;
  const ObjectArena& rhs_;
  std::size_t max_depth_;
  StructuralHasher lhs_hasher_;
  StructuralHasher rhs_hasher_;
  std::unordered_set<Pair, PairHash> active_;
  std::unordered_set<Pair, PairHash> proven_;
  std::unordered_set<Pair, PairHash> refuted_;
  std::vector<Pair> proven_log_;
};

}  // namespace

bool StructurallyEqual(const ObjectArena& lhs, ValueId a, const ObjectArena& rhs, ValueId b,
                       std::size_t maxDepth) {
  Comparer comparer(lhs, rhs, maxDepth);
  return comparer.equal(a, b);
}

bool StructurallyEqual(const Document& lhs, const Document& rhs) {
  return StructurallyEqual(lhs.arena(), lhs.root(), rhs.arena(), rhs.root());
}

}  // namespace pymarshal
