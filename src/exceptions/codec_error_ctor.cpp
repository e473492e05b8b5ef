/***
 * Name: pymarshal::exceptions::CodecError::CodecError
 * Purpose: Build the formatted message and keep kind/offset for callers.
 * Inputs:
 *   - direction: "decode" or "encode"
 *   - kind: failure category
 *   - offset: byte offset
 *   - detail: optional context (may be empty)
 * Outputs: Initialized exception object
 */
#include "pymarshal/exceptions/codec_error.h"

#include <string>

namespace pymarshal {
namespace exceptions {

static std::string FormatCodecMessage(const char* direction, ErrorKind kind, std::size_t offset,
                                      const std::string& detail) {
  std::string msg = std::string(direction) + " error at offset " + std::to_string(offset) + ": " +
                    ErrorKindName(kind);
  if (!detail.empty()) {
    msg += ": ";
    msg += detail;
  }
  return msg;
}

CodecError::CodecError(const char* direction, ErrorKind kind, std::size_t offset,
                       const std::string& detail)
    : PymarshalException(FormatCodecMessage(direction, kind, offset, detail)),
      kind_(kind),
      offset_(offset) {}

}  // namespace exceptions
}  // namespace pymarshal
