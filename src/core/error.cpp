#include "pbwire/core/error.hpp"

#include <string>

namespace pbwire::core {
namespace {

// core::errc 的 std::error_category 实现：
// - name() 用于区分错误域
// - message() 返回简短英文描述；带载荷的完整描述见 DecodeError::message()
class pbwire_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "pbwire"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::buffer_overflow:
        return "buffer overflow";
      case errc::invalid_varint:
        return "invalid varint";
      case errc::unknown_wire_type:
        return "unknown wire type";
      case errc::invalid_data:
        return "invalid data";
      default:
        return "unknown pbwire error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static pbwire_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

std::string DecodeError::message() const {
  switch (kind_) {
    case errc::ok:
      return "ok";
    case errc::buffer_overflow:
      return "protobuf: buffer overflow";
    case errc::invalid_varint:
      return "protobuf: invalid varint";
    case errc::unknown_wire_type:
      return "protobuf: unknown wire type " + std::to_string(wire_type_);
    case errc::invalid_data:
      return "protobuf: " + std::string(reason());
  }
  return "protobuf: " + make_error_code(kind_).message();
}

}  // 命名空间 pbwire::core
