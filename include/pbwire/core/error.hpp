#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace pbwire::core {

/**
 * @brief 本库唯一的错误域（封闭集合）。
 *
 * 约定：
 * - 所有 decode 接口在第一次失败时立即返回，不做任何恢复/重试；
 * - 失败时不写出任何部分结果（out 参数保持调用前的值）。
 */
enum class errc : int {
  ok = 0,
  buffer_overflow = 1,    // 输入剩余字节不足
  invalid_varint = 2,     // varint 续位链超过 64 位可表示宽度
  unknown_wire_type = 3,  // skip_field 收到 {0,1,2,5} 以外的 wire type
  invalid_data = 4,       // 解码值未通过语义校验（目前：string 非法 UTF-8）
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

/**
 * @brief 解码错误值：errc 加上诊断载荷。
 *
 * - unknown_wire_type 携带出错的 wire type 数值；
 * - invalid_data 携带原因字符串（必须指向静态存储期的字面量）。
 *
 * 默认构造表示成功；与 std::error_code 一样，在布尔上下文中“失败为 true”：
 *
 *   if (auto err = decode_varint(data, pos, v, pos)) { return err; }
 */
class DecodeError final {
 public:
  constexpr DecodeError() noexcept = default;

  [[nodiscard]] static constexpr DecodeError buffer_overflow() noexcept {
    return DecodeError(errc::buffer_overflow, 0, nullptr);
  }

  [[nodiscard]] static constexpr DecodeError invalid_varint() noexcept {
    return DecodeError(errc::invalid_varint, 0, nullptr);
  }

  [[nodiscard]] static constexpr DecodeError unknown_wire_type(std::uint64_t wire_type) noexcept {
    return DecodeError(errc::unknown_wire_type, wire_type, nullptr);
  }

  [[nodiscard]] static constexpr DecodeError invalid_data(const char* reason) noexcept {
    return DecodeError(errc::invalid_data, 0, reason);
  }

  [[nodiscard]] constexpr errc kind() const noexcept { return kind_; }

  // 仅对 unknown_wire_type 有意义，其余为 0。
  [[nodiscard]] constexpr std::uint64_t wire_type() const noexcept { return wire_type_; }

  // 仅对 invalid_data 有意义，其余为空串。
  [[nodiscard]] std::string_view reason() const noexcept {
    return reason_ != nullptr ? std::string_view(reason_) : std::string_view{};
  }

  [[nodiscard]] std::error_code code() const noexcept { return make_error_code(kind_); }

  /**
   * @brief 人类可读描述，例如 "protobuf: unknown wire type 7"。
   */
  [[nodiscard]] std::string message() const;

  constexpr explicit operator bool() const noexcept { return kind_ != errc::ok; }

  friend bool operator==(const DecodeError& lhs, const DecodeError& rhs) noexcept {
    return lhs.kind_ == rhs.kind_ && lhs.wire_type_ == rhs.wire_type_ &&
           lhs.reason() == rhs.reason();
  }

 private:
  constexpr DecodeError(errc kind, std::uint64_t wire_type, const char* reason) noexcept
      : kind_(kind), wire_type_(wire_type), reason_(reason) {}

  errc kind_{errc::ok};
  std::uint64_t wire_type_{0};
  const char* reason_{nullptr};
};

// string 字段 UTF-8 校验失败时使用的原因字符串。
inline constexpr const char* kInvalidUtf8Reason = "invalid UTF-8 in string field";

}  // namespace pbwire::core

namespace std {
template <>
struct is_error_code_enum<pbwire::core::errc> : true_type {};
}  // namespace std

namespace pbwire {

using core::DecodeError;

}  // namespace pbwire
