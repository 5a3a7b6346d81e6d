#include "pbwire/wire/varint.hpp"

#include "core/log_internal.hpp"

namespace pbwire::wire {

using core::kMaxVarintBytes;
using core::kVarintContinuationBit;
using core::kVarintPayloadMask;

void encode_varint(std::vector<byte>& out, std::uint64_t value) {
  while (value >= kVarintContinuationBit) {
    out.push_back(static_cast<byte>((value & kVarintPayloadMask) | kVarintContinuationBit));
    value >>= 7;
  }
  out.push_back(static_cast<byte>(value));
}

DecodeError decode_varint(bytes_view data,
                          std::size_t pos,
                          std::uint64_t& value,
                          std::size_t& new_pos) noexcept {
  const auto start = pos;
  std::uint64_t result = 0;
  unsigned shift = 0;
  for (;;) {
    if (pos >= data.size()) {
      return DecodeError::buffer_overflow();
    }
    const byte b = data[pos++];
    result |= static_cast<std::uint64_t>(b & kVarintPayloadMask) << shift;
    if ((b & kVarintContinuationBit) == 0) {
      value = result;
      new_pos = pos;
      return {};
    }
    shift += 7;
    if (shift > 63) {
      core::detail::logger().debug(
        "varint at offset {} exceeds {} bytes", start, kMaxVarintBytes);
      return DecodeError::invalid_varint();
    }
  }
}

std::size_t varint_size(std::uint64_t value) noexcept {
  std::size_t size = 1;
  while (value >= kVarintContinuationBit) {
    value >>= 7;
    ++size;
  }
  return size;
}

void encode_key(std::vector<byte>& out, std::uint64_t tag) { encode_varint(out, tag); }

DecodeError decode_key(bytes_view data,
                       std::size_t pos,
                       std::uint64_t& tag,
                       std::size_t& new_pos) noexcept {
  return decode_varint(data, pos, tag, new_pos);
}

void encode_bool(std::vector<byte>& out, bool value) {
  out.push_back(static_cast<byte>(value ? 0x01 : 0x00));
}

DecodeError decode_bool(bytes_view data,
                        std::size_t pos,
                        bool& value,
                        std::size_t& new_pos) noexcept {
  std::uint64_t raw = 0;
  if (auto err = decode_varint(data, pos, raw, new_pos)) {
    return err;
  }
  value = raw != 0;
  return {};
}

void encode_int32(std::vector<byte>& out, std::int32_t value) {
  // 先扩展为 int64 再转无符号：负数得到高位全 1 的 64 位补码。
  encode_varint(out, static_cast<std::uint64_t>(static_cast<std::int64_t>(value)));
}

DecodeError decode_int32(bytes_view data,
                         std::size_t pos,
                         std::int32_t& value,
                         std::size_t& new_pos) noexcept {
  std::uint64_t raw = 0;
  if (auto err = decode_varint(data, pos, raw, new_pos)) {
    return err;
  }
  value = static_cast<std::int32_t>(static_cast<std::uint32_t>(raw));
  return {};
}

void encode_int64(std::vector<byte>& out, std::int64_t value) {
  encode_varint(out, static_cast<std::uint64_t>(value));
}

DecodeError decode_int64(bytes_view data,
                         std::size_t pos,
                         std::int64_t& value,
                         std::size_t& new_pos) noexcept {
  std::uint64_t raw = 0;
  if (auto err = decode_varint(data, pos, raw, new_pos)) {
    return err;
  }
  value = static_cast<std::int64_t>(raw);
  return {};
}

void encode_uint32(std::vector<byte>& out, std::uint32_t value) { encode_varint(out, value); }

DecodeError decode_uint32(bytes_view data,
                          std::size_t pos,
                          std::uint32_t& value,
                          std::size_t& new_pos) noexcept {
  std::uint64_t raw = 0;
  if (auto err = decode_varint(data, pos, raw, new_pos)) {
    return err;
  }
  value = static_cast<std::uint32_t>(raw);
  return {};
}

}  // namespace pbwire::wire
