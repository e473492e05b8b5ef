/***
 * Name: pymarshal::Options
 * Purpose: Per-call codec configuration threaded explicitly through decode and encode.
 * Inputs:
 *   - version: marshal format version (0..4)
 *   - code_layout: field layout of code objects
 *   - max_depth: nesting limit for both directions
 *   - metrics: optional caller-owned collector; never shared implicitly
 * Outputs: Validated configuration
 * Theory of Operation: Plain aggregate with defaults matching the current format;
 *   ValidateOptions throws ConfigError before any byte is read or written.
 */
#pragma once

#include <cstddef>

#include "pymarshal/format/version.h"

namespace pymarshal {

namespace obs {
class Metrics;
}

/***
 * Name: pymarshal::CodeLayout
 * Purpose: Select the field sequence of serialized code objects.
 * Theory of Operation: The format version does not determine the code layout; it
 *   follows the runtime generation that wrote the blob.
 */
enum class CodeLayout {
  Python2,   // argcount, nlocals, stacksize, flags, ...
  Python30,  // argcount, kwonlyargcount, nlocals, stacksize, flags, ...
  Python38,  // argcount, posonlyargcount, kwonlyargcount, nlocals, stacksize, flags, ...
};

inline constexpr std::size_t kDefaultMaxDepth = 2000;
inline constexpr std::size_t kMaxDepthCeiling = 10000;

struct Options {
  int version = format::kCurrentVersion;
  CodeLayout code_layout = CodeLayout::Python38;
  std::size_t max_depth = kDefaultMaxDepth;
  obs::Metrics* metrics = nullptr;
};

/*** OptionsForVersion: Defaults with the given version. */
Options OptionsForVersion(int version);

/*** ValidateOptions: Throw ConfigError when version or depth is out of range. */
void ValidateOptions(const Options& opts);

}  // namespace pymarshal
