/***
 * Name: pymarshal::OptionsForVersion / ValidateOptions
 * Purpose: Construct and check per-call codec configuration.
 */
#include "pymarshal/format/options.h"

#include <string>

#include "pymarshal/exceptions/config_error.h"

namespace pymarshal {

Options OptionsForVersion(int version) {
  Options opts;
  opts.version = version;
  return opts;
}

void ValidateOptions(const Options& opts) {
  if (opts.version < format::kMinVersion || opts.version > format::kMaxVersion) {
    throw exceptions::ConfigError("unsupported marshal version " + std::to_string(opts.version) +
                                  " (expected " + std::to_string(format::kMinVersion) + ".." +
                                  std::to_string(format::kMaxVersion) + ")");
  }
  if (opts.max_depth == 0 || opts.max_depth > kMaxDepthCeiling) {
    throw exceptions::ConfigError("max_depth must be in 1.." + std::to_string(kMaxDepthCeiling) +
                                  ", got " + std::to_string(opts.max_depth));
  }
  switch (opts.code_layout) {
    case CodeLayout::Python2:
    case CodeLayout::Python30:
    case CodeLayout::Python38:
      return;
  }
  throw exceptions::ConfigError("unknown code layout");
}

}  // namespace pymarshal
