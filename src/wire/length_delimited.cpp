#include "pbwire/wire/length_delimited.hpp"

#include "core/log_internal.hpp"
#include "wire/cursor.hpp"

namespace pbwire::wire {
namespace {

constexpr bool in_range(byte b, byte lo, byte hi) noexcept { return b >= lo && b <= hi; }

constexpr bool is_continuation(byte b) noexcept { return (b & 0xC0u) == 0x80u; }

// 读取长度前缀并定位 payload；不拷贝。
DecodeError read_delimited(bytes_view data,
                           std::size_t pos,
                           bytes_view& payload,
                           std::size_t& new_pos) noexcept {
  std::uint64_t length = 0;
  std::size_t body = 0;
  if (auto err = decode_varint(data, pos, length, body)) {
    return err;
  }
  if (!detail::has_remaining(data, body, length)) {
    return DecodeError::buffer_overflow();
  }
  const auto n = static_cast<std::size_t>(length);
  payload = data.subspan(body, n);
  new_pos = body + n;
  return {};
}

}  // namespace

void encode_bytes(std::vector<byte>& out, bytes_view value) {
  encode_varint(out, static_cast<std::uint64_t>(value.size()));
  out.insert(out.end(), value.begin(), value.end());
}

DecodeError decode_bytes(bytes_view data,
                         std::size_t pos,
                         std::vector<byte>& value,
                         std::size_t& new_pos) {
  bytes_view payload{};
  std::size_t end = 0;
  if (auto err = read_delimited(data, pos, payload, end)) {
    return err;
  }
  value.assign(payload.begin(), payload.end());
  new_pos = end;
  return {};
}

void encode_string(std::vector<byte>& out, std::string_view value) {
  encode_bytes(out, bytes_view{reinterpret_cast<const byte*>(value.data()), value.size()});
}

DecodeError decode_string(bytes_view data,
                          std::size_t pos,
                          std::string& value,
                          std::size_t& new_pos) {
  bytes_view payload{};
  std::size_t end = 0;
  if (auto err = read_delimited(data, pos, payload, end)) {
    return err;
  }
  if (!is_valid_utf8(payload)) {
    core::detail::logger().debug(
      "string field at offset {} ({} bytes) is not valid UTF-8", pos, payload.size());
    return DecodeError::invalid_data(core::kInvalidUtf8Reason);
  }
  value.assign(reinterpret_cast<const char*>(payload.data()), payload.size());
  new_pos = end;
  return {};
}

bool is_valid_utf8(bytes_view bytes) noexcept {
  std::size_t i = 0;
  const std::size_t n = bytes.size();
  while (i < n) {
    const byte lead = bytes[i];
    if (lead < 0x80u) {
      ++i;
      continue;
    }

    // 按前导字节确定序列长度与第二字节的合法区间（Unicode 表 3-7）。
    std::size_t len = 0;
    byte lo = 0x80u;
    byte hi = 0xBFu;
    if (in_range(lead, 0xC2u, 0xDFu)) {
      len = 2;
    } else if (lead == 0xE0u) {
      len = 3;
      lo = 0xA0u;
    } else if (in_range(lead, 0xE1u, 0xECu) || in_range(lead, 0xEEu, 0xEFu)) {
      len = 3;
    } else if (lead == 0xEDu) {
      len = 3;
      hi = 0x9Fu;
    } else if (lead == 0xF0u) {
      len = 4;
      lo = 0x90u;
    } else if (in_range(lead, 0xF1u, 0xF3u)) {
      len = 4;
    } else if (lead == 0xF4u) {
      len = 4;
      hi = 0x8Fu;
    } else {
      return false;
    }

    if (n - i < len) {
      return false;
    }
    if (!in_range(bytes[i + 1], lo, hi)) {
      return false;
    }
    for (std::size_t k = 2; k < len; ++k) {
      if (!is_continuation(bytes[i + k])) {
        return false;
      }
    }
    i += len;
  }
  return true;
}

}  // namespace pbwire::wire
