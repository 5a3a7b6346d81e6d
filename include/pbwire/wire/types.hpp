#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace pbwire::wire {

/**
 * @brief protobuf wire type（字段字节的成帧方式）。
 *
 * 仅 {0,1,2,5} 合法；3/4（已废弃的 group）及其它值一律视为未知，
 * 由 skip_field 以 errc::unknown_wire_type 拒绝。
 */
enum class WireType : std::uint8_t {
  varint = 0,
  fixed64 = 1,
  length_delimited = 2,
  fixed32 = 5,
};

/**
 * @brief 将原始数值转换为 WireType；非法值返回 nullopt。
 */
[[nodiscard]] std::optional<WireType> wire_type_from_value(std::uint64_t value) noexcept;

[[nodiscard]] std::string_view to_string(WireType type) noexcept;

}  // namespace pbwire::wire
