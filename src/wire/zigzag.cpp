#include "pbwire/wire/zigzag.hpp"

namespace pbwire::wire {

void encode_zigzag32(std::vector<byte>& out, std::int32_t value) {
  encode_varint(out, zigzag_encode32(value));
}

void encode_zigzag64(std::vector<byte>& out, std::int64_t value) {
  encode_varint(out, zigzag_encode64(value));
}

DecodeError decode_zigzag32(bytes_view data,
                            std::size_t pos,
                            std::int32_t& value,
                            std::size_t& new_pos) noexcept {
  std::uint64_t raw = 0;
  if (auto err = decode_varint(data, pos, raw, new_pos)) {
    return err;
  }
  value = zigzag_decode32(static_cast<std::uint32_t>(raw));
  return {};
}

DecodeError decode_zigzag64(bytes_view data,
                            std::size_t pos,
                            std::int64_t& value,
                            std::size_t& new_pos) noexcept {
  std::uint64_t raw = 0;
  if (auto err = decode_varint(data, pos, raw, new_pos)) {
    return err;
  }
  value = zigzag_decode64(raw);
  return {};
}

}  // namespace pbwire::wire
