#pragma once

#include "pbwire/wire/types.hpp"
#include "pbwire/wire/varint.hpp"

#include <cstdint>

namespace pbwire::wire {

/**
 * @brief 跳过一个已编码的值（不物化），供上层解码器忽略未知字段。
 *
 * 按 wire type 分派：
 * - 0 varint：消费一个 varint（其错误原样返回）
 * - 1 fixed64：前移 8 字节
 * - 2 length-delimited：读 varint 长度，再前移该长度
 * - 5 fixed32：前移 4 字节
 * 以上前移均做边界检查，不足时返回 buffer_overflow；
 * 其它取值返回 unknown_wire_type（DecodeError::wire_type() 为该值）。
 *
 * wire_type 以原始数值传入：它通常直接来自 tag & 0x7，非法值必须在此拒绝。
 */
DecodeError skip_field(bytes_view data,
                       std::size_t pos,
                       std::uint64_t wire_type,
                       std::size_t& new_pos) noexcept;

}  // namespace pbwire::wire
