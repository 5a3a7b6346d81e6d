#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace pbwire::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// 64 位取值的 varint 最多 10 字节（9 个续位字节 + 1 个终止字节）。
inline constexpr std::size_t kMaxVarintBytes = 10;

inline constexpr std::size_t kFixed32Size = 4;
inline constexpr std::size_t kFixed64Size = 8;

// varint 每字节的续位（continuation bit）与有效载荷掩码。
inline constexpr byte kVarintContinuationBit = 0x80;
inline constexpr byte kVarintPayloadMask = 0x7F;

} // namespace pbwire::core

namespace pbwire {

using core::byte;
using core::bytes_view;
using core::mutable_bytes_view;

} // namespace pbwire
