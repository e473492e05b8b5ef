/***
 * Name: pymarshal::format::TypeCodeFromByte
 * Purpose: Validate the low seven bits of a tag byte against the closed enumeration.
 * Inputs: code (flag bit already stripped or not; it is masked here)
 * Outputs: TypeCode or nullopt
 */
#include "pymarshal/format/type_code.h"

namespace pymarshal::format {

std::optional<TypeCode> TypeCodeFromByte(std::uint8_t code) noexcept {
  const auto raw = static_cast<std::uint8_t>(code & kTypeMask);
  switch (static_cast<TypeCode>(raw)) {
    case TypeCode::Null:
    case TypeCode::None:
    case TypeCode::False:
    case TypeCode::True:
    case TypeCode::StopIteration:
    case TypeCode::Ellipsis:
    case TypeCode::Int:
    case TypeCode::Int64:
    case TypeCode::Float:
    case TypeCode::BinaryFloat:
    case TypeCode::Complex:
    case TypeCode::BinaryComplex:
    case TypeCode::Long:
    case TypeCode::String:
    case TypeCode::Interned:
    case TypeCode::Ref:
    case TypeCode::StringRef:
    case TypeCode::Tuple:
    case TypeCode::SmallTuple:
    case TypeCode::List:
    case TypeCode::Dict:
    case TypeCode::Code:
    case TypeCode::Unicode:
    case TypeCode::Unknown:
    case TypeCode::Set:
    case TypeCode::FrozenSet:
    case TypeCode::Ascii:
    case TypeCode::AsciiInterned:
    case TypeCode::ShortAscii:
    case TypeCode::ShortAsciiInterned:
      return static_cast<TypeCode>(raw);
  }
  return std::nullopt;
}

}  // namespace pymarshal::format
