#pragma once

#include "pbwire/core/common.hpp"

#include <cstddef>
#include <cstdint>

namespace pbwire::wire::detail {

// 判断 [pos, pos + n) 是否完整落在 data 内；n 为 uint64，避免在 32 位 size_t 上截断。
[[nodiscard]] constexpr bool has_remaining(core::bytes_view data,
                                           std::size_t pos,
                                           std::uint64_t n) noexcept {
  return pos <= data.size() && n <= static_cast<std::uint64_t>(data.size() - pos);
}

}  // namespace pbwire::wire::detail
