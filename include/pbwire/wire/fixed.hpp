#pragma once

#include "pbwire/wire/varint.hpp"

#include <cstdint>

namespace pbwire::wire {

/**
 * @brief 定长小端编解码（wire type 1 = 64 位，wire type 5 = 32 位）。
 *
 * - 直接写出 4/8 字节小端表示，无长度前缀、无 varint 成帧；
 * - 解码要求 pos 处至少剩余 4/8 字节，否则 buffer_overflow；
 * - sfixed* 与 float/double 均为对无符号形式的位重解释（std::bit_cast），
 *   保持位模式不变（包括 NaN 载荷与 -0.0）。
 */
void encode_fixed32(std::vector<byte>& out, std::uint32_t value);
void encode_fixed64(std::vector<byte>& out, std::uint64_t value);

DecodeError decode_fixed32(bytes_view data,
                           std::size_t pos,
                           std::uint32_t& value,
                           std::size_t& new_pos) noexcept;
DecodeError decode_fixed64(bytes_view data,
                           std::size_t pos,
                           std::uint64_t& value,
                           std::size_t& new_pos) noexcept;

void encode_sfixed32(std::vector<byte>& out, std::int32_t value);
void encode_sfixed64(std::vector<byte>& out, std::int64_t value);

DecodeError decode_sfixed32(bytes_view data,
                            std::size_t pos,
                            std::int32_t& value,
                            std::size_t& new_pos) noexcept;
DecodeError decode_sfixed64(bytes_view data,
                            std::size_t pos,
                            std::int64_t& value,
                            std::size_t& new_pos) noexcept;

// proto float / double
void encode_float(std::vector<byte>& out, float value);
void encode_double(std::vector<byte>& out, double value);

DecodeError decode_float(bytes_view data,
                         std::size_t pos,
                         float& value,
                         std::size_t& new_pos) noexcept;
DecodeError decode_double(bytes_view data,
                          std::size_t pos,
                          double& value,
                          std::size_t& new_pos) noexcept;

}  // namespace pbwire::wire
