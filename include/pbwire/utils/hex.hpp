#pragma once

#include "pbwire/core/common.hpp"
#include "pbwire/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace pbwire::utils {

/**
 * @brief 16 进制解析/格式化工具（排查线上字节流、编写测试向量）。
 *
 * 典型用法：把抓包里的 "08 96 01" 解析为 bytes，
 * 或把编码结果以 hexdump 形式写入日志。
 */

struct HexDumpOptions final {
    // 每行字节数；0 按 16 处理。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分打印截断提示。
    std::size_t max_bytes{256};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};
};

/**
 * @brief 将 bytes 以 hexdump 形式格式化为字符串（小写 hex，每行以 '\n' 结尾）。
 */
[[nodiscard]] std::string hex_dump(core::bytes_view bytes, HexDumpOptions options = {});

/**
 * @brief 单行紧凑格式："08 96 01"；空输入返回空串。
 */
[[nodiscard]] std::string to_hex(core::bytes_view bytes);

/**
 * @brief 解析 16 进制字符串为 bytes（覆盖 out 原有内容）。
 *
 * 忽略空白、逗号、冒号、连字符与可选的 0x/0X 前缀；
 * 非 hex 字符或 nibble 个数为奇数时返回 core::errc::invalid_data，out 被清空。
 */
std::error_code parse_hex(std::string_view text, std::vector<core::byte>& out) noexcept;

} // namespace pbwire::utils
