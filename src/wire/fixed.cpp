#include "pbwire/wire/fixed.hpp"

#include "wire/cursor.hpp"

#include <array>
#include <bit>
#include <type_traits>

namespace pbwire::wire {
namespace {

static_assert(sizeof(float) == core::kFixed32Size);
static_assert(sizeof(double) == core::kFixed64Size);

template <class UInt>
void write_le_uint(std::vector<byte>& out, UInt v) {
  static_assert(std::is_unsigned_v<UInt>);
  std::array<byte, sizeof(UInt)> buf{};
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    buf[i] = static_cast<byte>((v >> (8u * i)) & 0xFFu);
  }
  out.insert(out.end(), buf.begin(), buf.end());
}

template <class UInt>
DecodeError read_le_uint(bytes_view data, std::size_t pos, UInt& value, std::size_t& new_pos) noexcept {
  static_assert(std::is_unsigned_v<UInt>);
  if (!detail::has_remaining(data, pos, sizeof(UInt))) {
    return DecodeError::buffer_overflow();
  }
  UInt v = 0;
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    v = static_cast<UInt>(v | (static_cast<UInt>(data[pos + i]) << (8u * i)));
  }
  value = v;
  new_pos = pos + sizeof(UInt);
  return {};
}

// 先按无符号读出，再位重解释为目标类型。
template <class T, class UInt>
DecodeError read_le_bits(bytes_view data, std::size_t pos, T& value, std::size_t& new_pos) noexcept {
  static_assert(sizeof(T) == sizeof(UInt));
  UInt raw = 0;
  if (auto err = read_le_uint<UInt>(data, pos, raw, new_pos)) {
    return err;
  }
  value = std::bit_cast<T>(raw);
  return {};
}

}  // namespace

void encode_fixed32(std::vector<byte>& out, std::uint32_t value) { write_le_uint(out, value); }

void encode_fixed64(std::vector<byte>& out, std::uint64_t value) { write_le_uint(out, value); }

DecodeError decode_fixed32(bytes_view data,
                           std::size_t pos,
                           std::uint32_t& value,
                           std::size_t& new_pos) noexcept {
  return read_le_uint(data, pos, value, new_pos);
}

DecodeError decode_fixed64(bytes_view data,
                           std::size_t pos,
                           std::uint64_t& value,
                           std::size_t& new_pos) noexcept {
  return read_le_uint(data, pos, value, new_pos);
}

void encode_sfixed32(std::vector<byte>& out, std::int32_t value) {
  write_le_uint(out, std::bit_cast<std::uint32_t>(value));
}

void encode_sfixed64(std::vector<byte>& out, std::int64_t value) {
  write_le_uint(out, std::bit_cast<std::uint64_t>(value));
}

DecodeError decode_sfixed32(bytes_view data,
                            std::size_t pos,
                            std::int32_t& value,
                            std::size_t& new_pos) noexcept {
  return read_le_bits<std::int32_t, std::uint32_t>(data, pos, value, new_pos);
}

DecodeError decode_sfixed64(bytes_view data,
                            std::size_t pos,
                            std::int64_t& value,
                            std::size_t& new_pos) noexcept {
  return read_le_bits<std::int64_t, std::uint64_t>(data, pos, value, new_pos);
}

void encode_float(std::vector<byte>& out, float value) {
  write_le_uint(out, std::bit_cast<std::uint32_t>(value));
}

void encode_double(std::vector<byte>& out, double value) {
  write_le_uint(out, std::bit_cast<std::uint64_t>(value));
}

DecodeError decode_float(bytes_view data,
                         std::size_t pos,
                         float& value,
                         std::size_t& new_pos) noexcept {
  return read_le_bits<float, std::uint32_t>(data, pos, value, new_pos);
}

DecodeError decode_double(bytes_view data,
                          std::size_t pos,
                          double& value,
                          std::size_t& new_pos) noexcept {
  return read_le_bits<double, std::uint64_t>(data, pos, value, new_pos);
}

}  // namespace pbwire::wire
