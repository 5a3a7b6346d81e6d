#pragma once

#include "pbwire/wire/varint.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pbwire::wire {

/**
 * @brief length-delimited（wire type 2）：varint 长度前缀 + 原始字节，无填充、无终止符。
 */
void encode_bytes(std::vector<byte>& out, bytes_view value);

/**
 * @brief 解码 bytes 字段，返回该字节区间的拷贝（本层唯一的解码期分配）。
 *
 * 失败：
 * - 长度前缀本身的 varint 错误原样返回；
 * - 声明长度超过剩余字节数：buffer_overflow。
 */
DecodeError decode_bytes(bytes_view data,
                         std::size_t pos,
                         std::vector<byte>& value,
                         std::size_t& new_pos);

// string 字段：按 UTF-8 字节序列走 bytes 编码。
void encode_string(std::vector<byte>& out, std::string_view value);

/**
 * @brief 解码 string 字段，额外做严格 UTF-8 校验。
 *
 * 非法 UTF-8 返回 invalid_data（reason 为 core::kInvalidUtf8Reason），
 * 不做替换字符之类的有损修复，value 保持不变。
 */
DecodeError decode_string(bytes_view data,
                          std::size_t pos,
                          std::string& value,
                          std::size_t& new_pos);

/**
 * @brief 严格 UTF-8 校验。
 *
 * 拒绝：过长编码（含 0xC0/0xC1 前导）、代理区 U+D800..U+DFFF、
 * 超过 U+10FFFF 的码点（含 0xF5..0xFF 前导）、截断的多字节序列、孤立的续字节。
 */
[[nodiscard]] bool is_valid_utf8(bytes_view bytes) noexcept;

}  // namespace pbwire::wire
