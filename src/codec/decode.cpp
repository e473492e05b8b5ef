/***
 * Name: pymarshal::Decode
 * Purpose: Validate options, run a Decoder and publish its statistics.
 */
#include <utility>

#include "pymarshal/codec/decoder.h"
#include "pymarshal/codec/marshal.h"
#include "pymarshal/obs/metrics.h"

namespace pymarshal {

Document Decode(const std::uint8_t* data, std::size_t size, const Options& opts) {
  ValidateOptions(opts);
  obs::Metrics* metrics = opts.metrics;
  if (metrics != nullptr) { metrics->start("Decode"); }
  codec::Decoder decoder(data, size, opts);
  Document doc = decoder.run();
  if (metrics != nullptr) {
    metrics->stop("Decode");
    metrics->incCounter("decode.objects", decoder.objectCount());
    metrics->incCounter("decode.references", doc.referenceCount());
    metrics->incCounter("decode.backreferences", decoder.backreferenceCount());
    metrics->incCounter("decode.bytes", doc.consumedBytes());
    metrics->raiseGauge("decode.max_depth", decoder.maxDepthSeen());
  }
  return doc;
}

Document Decode(const std::vector<std::uint8_t>& data, const Options& opts) {
  return Decode(data.data(), data.size(), opts);
}

Document Decode(const std::vector<std::uint8_t>& data, int version) {
  return Decode(data.data(), data.size(), OptionsForVersion(version));
}

}  // namespace pymarshal
