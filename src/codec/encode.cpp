/***
 * Name: pymarshal::Encode
 * Purpose: Validate options, run an Encoder and publish its statistics.
 */
#include "pymarshal/codec/encoder.h"
#include "pymarshal/codec/marshal.h"
#include "pymarshal/obs/metrics.h"

namespace pymarshal {

std::vector<std::uint8_t> Encode(const ObjectArena& arena, ValueId root, const Options& opts) {
  ValidateOptions(opts);
  obs::Metrics* metrics = opts.metrics;
  if (metrics != nullptr) { metrics->start("Encode"); }
  codec::Encoder encoder(arena, opts);
  std::vector<std::uint8_t> out = encoder.run(root);
  if (metrics != nullptr) {
    metrics->stop("Encode");
    metrics->incCounter("encode.objects", encoder.objectCount());
    metrics->incCounter("encode.references", encoder.referenceCount());
    metrics->incCounter("encode.backreferences", encoder.backreferenceCount());
    metrics->incCounter("encode.bytes", out.size());
  }
  return out;
}

std::vector<std::uint8_t> Encode(const ObjectArena& arena, ValueId root, int version) {
  return Encode(arena, root, OptionsForVersion(version));
}

std::vector<std::uint8_t> Encode(const Document& doc, const Options& opts) {
  return Encode(doc.arena(), doc.root(), opts);
}

std::vector<std::uint8_t> Encode(const Document& doc, int version) {
  return Encode(doc.arena(), doc.root(), OptionsForVersion(version));
}

}  // namespace pymarshal
