#pragma once

#include "pbwire/wire/varint.hpp"

#include <cstdint>

namespace pbwire::wire {

/**
 * @brief ZigZag 映射：有符号 -> 无符号，使绝对值小的负数也得到短 varint。
 *
 *   0 -> 0, -1 -> 1, 1 -> 2, -2 -> 3, ...
 *
 * 等价于 (v << 1) ^ (v >> (bits - 1))（算术右移）；
 * 左移在无符号域完成，对 INT_MIN 等极值没有有符号溢出。
 */
[[nodiscard]] constexpr std::uint32_t zigzag_encode32(std::int32_t value) noexcept {
  return (static_cast<std::uint32_t>(value) << 1) ^ static_cast<std::uint32_t>(value >> 31);
}

[[nodiscard]] constexpr std::uint64_t zigzag_encode64(std::int64_t value) noexcept {
  return (static_cast<std::uint64_t>(value) << 1) ^ static_cast<std::uint64_t>(value >> 63);
}

// 逆映射：(n >> 1) ^ -(n & 1)，取负在无符号域完成。
[[nodiscard]] constexpr std::int32_t zigzag_decode32(std::uint32_t value) noexcept {
  return static_cast<std::int32_t>((value >> 1) ^ (~(value & 1u) + 1u));
}

[[nodiscard]] constexpr std::int64_t zigzag_decode64(std::uint64_t value) noexcept {
  return static_cast<std::int64_t>((value >> 1) ^ (~(value & 1u) + 1u));
}

// proto sint32 / sint64
void encode_zigzag32(std::vector<byte>& out, std::int32_t value);
void encode_zigzag64(std::vector<byte>& out, std::int64_t value);

/**
 * @brief 先 varint 解码再做 ZigZag 逆映射；失败模式与 decode_varint 相同。
 *
 * decode_zigzag32 只使用 varint 的低 32 位。
 */
DecodeError decode_zigzag32(bytes_view data,
                            std::size_t pos,
                            std::int32_t& value,
                            std::size_t& new_pos) noexcept;
DecodeError decode_zigzag64(bytes_view data,
                            std::size_t pos,
                            std::int64_t& value,
                            std::size_t& new_pos) noexcept;

}  // namespace pbwire::wire
