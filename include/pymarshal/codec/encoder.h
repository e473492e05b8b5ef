/***
 * Name: pymarshal::codec::Encoder
 * Purpose: Mirror writer that serializes an arena graph into marshal bytes.
 * Inputs:
 *   - The arena and a root handle.
 *   - Options (version, code layout, depth limit, optional metrics sink).
 * Outputs:
 *   - The encoded byte vector; EncodeError when a value cannot be represented.
 * Theory of Operation:
 *   From version 3 a pre-pass counts how many edges reach each node (the root counts
 *   once). A node is written with the reference flag when it is reached more than once
 *   or was decoded flagged; its slot number is assigned as the tag is emitted, so the
 *   numbering matches what a decoder reserves. Later visits emit Ref. Versions 1 and 2
 *   share only interned strings, by text, through StringRef; everything else is written
 *   in full and cycles run into the depth limit.
 *   An Encoder is single-use: construct, call run() once.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "pymarshal/exceptions/error_kind.h"
#include "pymarshal/format/options.h"
#include "pymarshal/format/type_code.h"
#include "pymarshal/model/object_arena.h"
#include "pymarshal/support/byte_writer.h"

namespace pymarshal {
namespace codec {

class Encoder {
 public:
  Encoder(const ObjectArena& arena, const Options& opts);

  std::vector<std::uint8_t> run(ValueId root);

  std::size_t objectCount() const noexcept { return objects_; }
  std::size_t referenceCount() const noexcept;
  std::size_t backreferenceCount() const noexcept { return backrefs_; }

 private:
  void countIncomingEdges(ValueId root);
  bool shouldFlag(ValueId id, const Value& v) const;

  void writeObject(ValueId id, std::size_t depth);
  void writeTag(format::TypeCode code, bool flagged);
  void writeLength(std::size_t n, const char* what);
  void writeLong(const BigInt& value);
  void writeFloat(double value);
  void writeText(const Value& v, bool flagged);
  void writeSequence(format::TypeCode code, const Value::Elements& elements, bool flagged,
                     std::size_t depth);
  void writeDict(const Value::Entries& entries, bool flagged, std::size_t depth);
  void writeCode(const CodeObject& c, bool flagged, std::size_t depth);
  void writeCodeField(ValueId id, Kind kind, bool allowBytes, const char* field, std::size_t depth);

  [[noreturn]] void fail(exceptions::ErrorKind kind, const std::string& detail) const;

  const ObjectArena& arena_;
  Options opts_;
  support::ByteWriter writer_;
  std::vector<std::uint32_t> incoming_;
  std::unordered_map<ValueId, std::uint32_t> slots_;
  std::unordered_map<std::string, std::uint32_t> interned_;
  std::size_t objects_{0};
  std::size_t backrefs_{0};
};

}  // namespace codec
}  // namespace pymarshal
