#pragma once

#include "pbwire/core/common.hpp"
#include "pbwire/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pbwire::wire {

using core::byte;
using core::bytes_view;
using core::DecodeError;

/*
 * 解码接口统一约定（本目录下所有 decode_* 相同）：
 * - data 为只读输入，pos 为下一个未读字节的偏移；
 * - 成功时写出 value 与 new_pos（new_pos >= pos 且 new_pos <= data.size()）；
 * - 失败时返回非空 DecodeError，value/new_pos 保持不变；
 * - pos 按值传入，new_pos 可以直接传入保存 pos 的变量（游标原地前移）；
 * - pos > data.size() 视为 buffer_overflow。
 *
 * 编码接口统一约定：只向 out 尾部追加，不读取 out 已有内容。
 */

/**
 * @brief base-128 varint 编码（小端 7 位分组，除末字节外均置 0x80 续位）。
 *
 * 任何取值至少输出 1 字节（0 编码为 0x00）。
 */
void encode_varint(std::vector<byte>& out, std::uint64_t value);

/**
 * @brief varint 解码。
 *
 * 失败：
 * - 终止字节出现前输入耗尽：buffer_overflow
 * - 出现第 10 个续位字节（移位超过 63）：invalid_varint
 */
DecodeError decode_varint(bytes_view data,
                          std::size_t pos,
                          std::uint64_t& value,
                          std::size_t& new_pos) noexcept;

/**
 * @brief encode_varint(value) 将输出的字节数（1..10）。
 */
[[nodiscard]] std::size_t varint_size(std::uint64_t value) noexcept;

/**
 * @brief 编码字段 key（tag）。
 *
 * tag 为调用方组合好的 (field_number << 3) | wire_type；本层只负责 varint 成帧，
 * 不做拆分。
 */
void encode_key(std::vector<byte>& out, std::uint64_t tag);

// decode_varint 的别名；tag 拆分由调用方完成（tag >> 3, tag & 0x7）。
DecodeError decode_key(bytes_view data,
                       std::size_t pos,
                       std::uint64_t& tag,
                       std::size_t& new_pos) noexcept;

/**
 * @brief bool：编码为单字节 0x00/0x01；解码时任意非零 varint 均为 true。
 */
void encode_bool(std::vector<byte>& out, bool value);
DecodeError decode_bool(bytes_view data,
                        std::size_t pos,
                        bool& value,
                        std::size_t& new_pos) noexcept;

/**
 * @brief proto int32/enum：负数先符号扩展到 64 位再编码（固定 10 字节）。
 *
 * 解码取 varint 的低 32 位。
 */
void encode_int32(std::vector<byte>& out, std::int32_t value);
DecodeError decode_int32(bytes_view data,
                         std::size_t pos,
                         std::int32_t& value,
                         std::size_t& new_pos) noexcept;

// proto int64：按二进制补码重解释为 uint64 后编码。
void encode_int64(std::vector<byte>& out, std::int64_t value);
DecodeError decode_int64(bytes_view data,
                         std::size_t pos,
                         std::int64_t& value,
                         std::size_t& new_pos) noexcept;

// proto uint32：解码取低 32 位。
void encode_uint32(std::vector<byte>& out, std::uint32_t value);
DecodeError decode_uint32(bytes_view data,
                          std::size_t pos,
                          std::uint32_t& value,
                          std::size_t& new_pos) noexcept;

}  // namespace pbwire::wire
