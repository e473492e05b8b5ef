/***
 * Name: pymarshal::Decode / pymarshal::Encode
 * Purpose: Public entry points of the codec.
 * Inputs:
 *   - Decode: a complete byte buffer and either a version or full Options.
 *   - Encode: an arena and root handle (or a Document) and either a version or Options.
 * Outputs:
 *   - Decode: a Document owning the decoded graph.
 *   - Encode: the serialized bytes.
 * Theory of Operation:
 *   Options are validated first (ConfigError). Each call builds its own reference table
 *   and, for decode, its own arena; nothing is shared between calls, so independent calls
 *   may run on separate threads. Failures throw DecodeError/EncodeError and release all
 *   per-call state during unwinding. When Options::metrics is set, the call records its
 *   stage time and counters there.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "pymarshal/format/options.h"
#include "pymarshal/model/document.h"
#include "pymarshal/model/object_arena.h"

namespace pymarshal {

Document Decode(const std::uint8_t* data, std::size_t size, const Options& opts);
Document Decode(const std::vector<std::uint8_t>& data, const Options& opts);
Document Decode(const std::vector<std::uint8_t>& data, int version);

std::vector<std::uint8_t> Encode(const ObjectArena& arena, ValueId root, const Options& opts);
std::vector<std::uint8_t> Encode(const ObjectArena& arena, ValueId root, int version);
std::vector<std::uint8_t> Encode(const Document& doc, const Options& opts);
std::vector<std::uint8_t> Encode(const Document& doc, int version);

}  // namespace pymarshal
