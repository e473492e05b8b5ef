/***
 * Name: pymarshal::codec::Decoder
 * Purpose: Recursive-descent reader for one marshal blob.
 * Inputs:
 *   - A fully buffered byte range.
 *   - Options (version, code layout, depth limit, optional metrics sink).
 * Outputs:
 *   - A Document holding the decoded graph; DecodeError on malformed input.
 * Theory of Operation:
 *   Each call to readObject consumes one tag byte, splits off the reference flag, and
 *   dispatches on the type code. The depth is passed explicitly and checked on entry.
 *   Flagged objects reserve a reference slot at their tag; containers are appended to the
 *   arena before their children are read, so a back-reference to an enclosing container
 *   yields its handle. Scalars and code objects fill their slot once complete; a reference
 *   to a still-empty slot is rejected. Under versions 1 and 2 the table holds only interned
 *   strings and is addressed by StringRef.
 *   Set members and dict keys are de-duplicated through one KeyIndex per container; a key
 *   nested too deep to hash or compare fails RecursionLimitExceeded.
 *   A Decoder is single-use: construct, call run() once.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "pymarshal/exceptions/error_kind.h"
#include "pymarshal/format/options.h"
#include "pymarshal/format/type_code.h"
#include "pymarshal/model/document.h"
#include "pymarshal/model/key_index.h"
#include "pymarshal/model/object_arena.h"
#include "pymarshal/support/byte_reader.h"

namespace pymarshal {
namespace codec {

class Decoder {
 public:
  Decoder(const std::uint8_t* data, std::size_t size, const Options& opts);

  Document run();

  std::size_t objectCount() const noexcept { return objects_; }
  std::size_t backreferenceCount() const noexcept { return backrefs_; }
  std::size_t maxDepthSeen() const noexcept { return max_depth_seen_; }

 private:
  static constexpr std::size_t kNoSlot = static_cast<std::size_t>(-1);

  /*** readObject: One value at the given depth; a Null tag fails UnexpectedNull. */
  ValueId readObject(std::size_t depth);
  /*** readObjectOrNull: As readObject, but a Null tag yields kInvalidValueId. */
  ValueId readObjectOrNull(std::size_t depth);

  ValueId readSingleton(format::TypeCode code);
  ValueId readLong(std::size_t tagOffset);
  double readTextFloat();
  ValueId readText(format::TypeCode code, bool shortLength);
  ValueId readBackreference(std::size_t tagOffset);
  ValueId readSequence(Kind kind, std::size_t count, std::size_t depth, std::size_t slot);
  ValueId readDict(std::size_t depth, std::size_t slot);
  ValueId readCode(std::size_t depth);
  std::int32_t readCountField();
  ValueId readCodeField(std::size_t depth, const char* field, bool allowBytes);

  /*** readLength: Signed 32-bit length prefix; negative values fail InvalidLength. */
  std::size_t readLength();
  std::size_t reserveSlot(bool flagged);
  void fillSlot(std::size_t slot, ValueId id);
  ValueId add(Value v, bool flagged);
  void requireKind(ValueId id, Kind kind, const char* field, std::size_t offset) const;
  void requireHashable(ValueId id, const char* role, std::size_t offset) const;
  std::size_t indexKey(KeyIndex& index, ValueId id, std::size_t position, std::size_t offset) const;

  [[noreturn]] void fail(exceptions::ErrorKind kind, std::size_t offset,
                         const std::string& detail) const;

  support::ByteReader reader_;
  Options opts_;
  ObjectArena arena_;
  std::vector<ValueId> refs_;
  ValueId none_{kInvalidValueId};
  ValueId true_{kInvalidValueId};
  ValueId false_{kInvalidValueId};
  ValueId stop_iteration_{kInvalidValueId};
  ValueId ellipsis_{kInvalidValueId};
  std::size_t objects_{0};
  std::size_t backrefs_{0};
  std::size_t max_depth_seen_{0};
};

}  // namespace codec
}  // namespace pymarshal
