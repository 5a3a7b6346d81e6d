#include "pbwire/wire/skip.hpp"

#include "pbwire/wire/fixed.hpp"
#include "pbwire/wire/length_delimited.hpp"
#include "pbwire/wire/types.hpp"
#include "pbwire/wire/varint.hpp"
#include "pbwire/wire/zigzag.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace {

using pbwire::byte;
using pbwire::bytes_view;
using pbwire::core::errc;
using namespace pbwire::wire;

void test_skip_varint() {
    std::vector<byte> buf;
    encode_varint(buf, 300);
    std::size_t pos = 0;
    TEST_EXPECT_OK(skip_field(bytes_view{buf}, 0, 0, pos));
    TEST_EXPECT_EQ(pos, buf.size());
    TEST_EXPECT_EQ(pos, 2u);
}

void test_skip_fixed64() {
    std::vector<byte> buf;
    encode_fixed64(buf, 42);
    std::size_t pos = 0;
    TEST_EXPECT_OK(skip_field(bytes_view{buf}, 0, 1, pos));
    TEST_EXPECT_EQ(pos, 8u);
}

void test_skip_length_delimited() {
    std::vector<byte> buf;
    encode_string(buf, "hello");
    std::size_t pos = 0;
    TEST_EXPECT_OK(skip_field(bytes_view{buf}, 0, 2, pos));
    TEST_EXPECT_EQ(pos, buf.size());
    TEST_EXPECT_EQ(pos, 6u);
}

void test_skip_fixed32() {
    std::vector<byte> buf;
    encode_fixed32(buf, 42);
    std::size_t pos = 0;
    TEST_EXPECT_OK(skip_field(bytes_view{buf}, 0, 5, pos));
    TEST_EXPECT_EQ(pos, 4u);
}

void test_skip_unknown_wire_types() {
    const std::vector<byte> buf(16, byte{0x00});
    for (const std::uint64_t wt : {3ull, 4ull, 6ull, 7ull, 8ull, 0xFFFFFFFFFFFFFFFFull}) {
        std::size_t pos = 11;
        const auto err = skip_field(bytes_view{buf}, 0, wt, pos);
        TEST_EXPECT_ERR(err, errc::unknown_wire_type);
        TEST_EXPECT_EQ(err.wire_type(), wt);
        TEST_EXPECT_EQ(pos, 11u);
    }
    // 即使输入为空，未知 wire type 也优先报告为 unknown_wire_type。
    std::size_t pos = 0;
    TEST_EXPECT_ERR(skip_field(bytes_view{}, 0, 6, pos), errc::unknown_wire_type);
}

void test_skip_bounds() {
    std::size_t pos = 0;
    const std::vector<byte> seven(7, byte{0x00});
    const std::vector<byte> three(3, byte{0x00});

    TEST_EXPECT_ERR(skip_field(bytes_view{}, 0, 0, pos), errc::buffer_overflow);
    TEST_EXPECT_ERR(skip_field(bytes_view{seven}, 0, 1, pos), errc::buffer_overflow);
    TEST_EXPECT_ERR(skip_field(bytes_view{three}, 0, 5, pos), errc::buffer_overflow);
    TEST_EXPECT_ERR(skip_field(bytes_view{seven}, 4, 5, pos), errc::buffer_overflow);

    // 声明长度超过剩余字节
    const std::vector<byte> ld{0x05, 0x61, 0x62};
    TEST_EXPECT_ERR(skip_field(bytes_view{ld}, 0, 2, pos), errc::buffer_overflow);

    // varint 续位链过长
    const std::vector<byte> runaway(10, byte{0x80});
    TEST_EXPECT_ERR(skip_field(bytes_view{runaway}, 0, 0, pos), errc::invalid_varint);
    TEST_EXPECT_ERR(skip_field(bytes_view{runaway}, 0, 2, pos), errc::invalid_varint);

    // 恰好够用的边界
    TEST_EXPECT_OK(skip_field(bytes_view{seven}, 3, 5, pos));
    TEST_EXPECT_EQ(pos, 7u);
    const std::vector<byte> empty_ld{0x00};
    TEST_EXPECT_OK(skip_field(bytes_view{empty_ld}, 0, 2, pos));
    TEST_EXPECT_EQ(pos, 1u);
}

void test_skip_unknown_fields_in_message() {
    // 模拟上层解码器：只认识 field 2（string），其余字段全部跳过。
    std::vector<byte> msg;
    encode_key(msg, (1u << 3) | 0u);
    encode_zigzag64(msg, -12345);
    encode_key(msg, (2u << 3) | 2u);
    encode_string(msg, "wanted");
    encode_key(msg, (3u << 3) | 1u);
    encode_double(msg, 3.5);
    encode_key(msg, (4u << 3) | 5u);
    encode_fixed32(msg, 7u);
    encode_key(msg, (5u << 3) | 2u);
    encode_bytes(msg, bytes_view{std::vector<byte>(200, byte{0x01})});

    std::string name;
    std::size_t skipped = 0;
    std::size_t pos = 0;
    const bytes_view in{msg};
    while (pos < in.size()) {
        std::uint64_t tag = 0;
        if (auto err = decode_key(in, pos, tag, pos)) {
            TEST_FAIL(err.message());
            return;
        }
        if (tag == ((2u << 3) | 2u)) {
            TEST_EXPECT_OK(decode_string(in, pos, name, pos));
            continue;
        }
        if (auto err = skip_field(in, pos, tag & 0x7u, pos)) {
            TEST_FAIL(err.message());
            return;
        }
        ++skipped;
    }
    TEST_EXPECT_EQ(name, "wanted");
    TEST_EXPECT_EQ(skipped, 4u);
    TEST_EXPECT_EQ(pos, msg.size());
}

void test_wire_type_from_value() {
    TEST_EXPECT(wire_type_from_value(0) == WireType::varint);
    TEST_EXPECT(wire_type_from_value(1) == WireType::fixed64);
    TEST_EXPECT(wire_type_from_value(2) == WireType::length_delimited);
    TEST_EXPECT(wire_type_from_value(5) == WireType::fixed32);
    TEST_EXPECT(!wire_type_from_value(3).has_value());
    TEST_EXPECT(!wire_type_from_value(4).has_value());
    TEST_EXPECT(!wire_type_from_value(6).has_value());
    TEST_EXPECT(!wire_type_from_value(0x100).has_value());

    TEST_EXPECT_EQ(to_string(WireType::varint), "varint");
    TEST_EXPECT_EQ(to_string(WireType::fixed64), "fixed64");
    TEST_EXPECT_EQ(to_string(WireType::length_delimited), "length-delimited");
    TEST_EXPECT_EQ(to_string(WireType::fixed32), "fixed32");
}

}  // namespace

int main() {
    test_skip_varint();
    test_skip_fixed64();
    test_skip_length_delimited();
    test_skip_fixed32();
    test_skip_unknown_wire_types();
    test_skip_bounds();
    test_skip_unknown_fields_in_message();
    test_wire_type_from_value();
    return ::pbwire::tests::run_and_report();
}
