#include "pbwire/wire/skip.hpp"

#include "core/log_internal.hpp"
#include "wire/cursor.hpp"

namespace pbwire::wire {
namespace {

DecodeError advance(bytes_view data, std::size_t pos, std::uint64_t n, std::size_t& new_pos) noexcept {
  if (!detail::has_remaining(data, pos, n)) {
    return DecodeError::buffer_overflow();
  }
  new_pos = pos + static_cast<std::size_t>(n);
  return {};
}

}  // namespace

DecodeError skip_field(bytes_view data,
                       std::size_t pos,
                       std::uint64_t wire_type,
                       std::size_t& new_pos) noexcept {
  const auto type = wire_type_from_value(wire_type);
  if (!type) {
    core::detail::logger().debug("cannot skip field at offset {}: unknown wire type {}", pos, wire_type);
    return DecodeError::unknown_wire_type(wire_type);
  }

  switch (*type) {
    case WireType::varint: {
      std::uint64_t ignored = 0;
      return decode_varint(data, pos, ignored, new_pos);
    }
    case WireType::fixed64:
      return advance(data, pos, core::kFixed64Size, new_pos);
    case WireType::length_delimited: {
      std::uint64_t length = 0;
      std::size_t body = 0;
      if (auto err = decode_varint(data, pos, length, body)) {
        return err;
      }
      return advance(data, body, length, new_pos);
    }
    case WireType::fixed32:
      return advance(data, pos, core::kFixed32Size, new_pos);
  }
  return DecodeError::unknown_wire_type(wire_type);
}

}  // namespace pbwire::wire
