/***
 * Name: pymarshal::KindName
 * Purpose: Display names for diagnostics.
 */
#include "pymarshal/model/kind.h"

namespace pymarshal {

const char* KindName(Kind kind) noexcept {
  switch (kind) {
    case Kind::None: return "None";
    case Kind::Bool: return "Bool";
    case Kind::StopIteration: return "StopIteration";
    case Kind::Ellipsis: return "Ellipsis";
    case Kind::Int: return "Int";
    case Kind::Long: return "Long";
    case Kind::Float: return "Float";
    case Kind::Complex: return "Complex";
    case Kind::Bytes: return "Bytes";
    case Kind::Str: return "Str";
    case Kind::Tuple: return "Tuple";
    case Kind::List: return "List";
    case Kind::Dict: return "Dict";
    case Kind::Set: return "Set";
    case Kind::FrozenSet: return "FrozenSet";
    case Kind::Code: return "Code";
    case Kind::Unknown: return "Unknown";
  }
  return "?";
}

}  // namespace pymarshal
