#include "pbwire/wire/types.hpp"

namespace pbwire::wire {

std::optional<WireType> wire_type_from_value(std::uint64_t value) noexcept {
  switch (value) {
    case static_cast<std::uint64_t>(WireType::varint):
    case static_cast<std::uint64_t>(WireType::fixed64):
    case static_cast<std::uint64_t>(WireType::length_delimited):
    case static_cast<std::uint64_t>(WireType::fixed32):
      return static_cast<WireType>(value);
    default:
      return std::nullopt;
  }
}

std::string_view to_string(WireType type) noexcept {
  switch (type) {
    case WireType::varint:
      return "varint";
    case WireType::fixed64:
      return "fixed64";
    case WireType::length_delimited:
      return "length-delimited";
    case WireType::fixed32:
      return "fixed32";
  }
  return "unknown";
}

}  // namespace pbwire::wire
