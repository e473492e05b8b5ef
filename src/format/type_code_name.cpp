/***
 * Name: pymarshal::format::TypeCodeName
 * Purpose: Display names for diagnostics.
 */
#include "pymarshal/format/type_code.h"

namespace pymarshal::format {

const char* TypeCodeName(TypeCode code) noexcept {
  switch (code) {
    case TypeCode::Null: return "Null";
    case TypeCode::None: return "None";
    case TypeCode::False: return "False";
    case TypeCode::True: return "True";
    case TypeCode::StopIteration: return "StopIteration";
    case TypeCode::Ellipsis: return "Ellipsis";
    case TypeCode::Int: return "Int";
    case TypeCode::Int64: return "Int64";
    case TypeCode::Float: return "Float";
    case TypeCode::BinaryFloat: return "BinaryFloat";
    case TypeCode::Complex: return "Complex";
    case TypeCode::BinaryComplex: return "BinaryComplex";
    case TypeCode::Long: return "Long";
    case TypeCode::String: return "String";
    case TypeCode::Interned: return "Interned";
    case TypeCode::Ref: return "Ref";
    case TypeCode::StringRef: return "StringRef";
    case TypeCode::Tuple: return "Tuple";
    case TypeCode::SmallTuple: return "SmallTuple";
    case TypeCode::List: return "List";
    case TypeCode::Dict: return "Dict";
    case TypeCode::Code: return "Code";
    case TypeCode::Unicode: return "Unicode";
    case TypeCode::Unknown: return "Unknown";
    case TypeCode::Set: return "Set";
    case TypeCode::FrozenSet: return "FrozenSet";
    case TypeCode::Ascii: return "Ascii";
    case TypeCode::AsciiInterned: return "AsciiInterned";
    case TypeCode::ShortAscii: return "ShortAscii";
    case TypeCode::ShortAsciiInterned: return "ShortAsciiInterned";
  }
  return "?";
}

}  // namespace pymarshal::format
