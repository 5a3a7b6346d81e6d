/**
 * @file wire_simple.cpp
 * @brief 用 pbwire 原语手写一个消息编解码（模拟代码生成器的输出）
 *
 *   message Reading {
 *     string sensor   = 1;
 *     sint32 delta    = 2;
 *     double value    = 3;
 *     repeated fixed32 flags = 4;
 *   }
 *
 * tag 的拆分（field_number = tag >> 3, wire_type = tag & 7）由本文件完成，
 * pbwire 只负责 varint 成帧。
 */

#include <pbwire/core/log.hpp>
#include <pbwire/utils/hex.hpp>
#include <pbwire/wire/fixed.hpp>
#include <pbwire/wire/length_delimited.hpp>
#include <pbwire/wire/skip.hpp>
#include <pbwire/wire/varint.hpp>
#include <pbwire/wire/zigzag.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using namespace pbwire;
using namespace pbwire::wire;

namespace {

struct Reading {
    std::string sensor;
    std::int32_t delta{0};
    double value{0.0};
    std::vector<std::uint32_t> flags;
};

constexpr std::uint64_t make_tag(std::uint32_t field, WireType type) {
    return (static_cast<std::uint64_t>(field) << 3) | static_cast<std::uint64_t>(type);
}

std::vector<byte> encode_reading(const Reading &r) {
    std::vector<byte> out;
    encode_key(out, make_tag(1, WireType::length_delimited));
    encode_string(out, r.sensor);
    encode_key(out, make_tag(2, WireType::varint));
    encode_zigzag32(out, r.delta);
    encode_key(out, make_tag(3, WireType::fixed64));
    encode_double(out, r.value);
    for (const auto f : r.flags) {
        encode_key(out, make_tag(4, WireType::fixed32));
        encode_fixed32(out, f);
    }
    return out;
}

DecodeError decode_reading(bytes_view in, Reading &r) {
    std::size_t pos = 0;
    while (pos < in.size()) {
        std::uint64_t tag = 0;
        if (auto err = decode_key(in, pos, tag, pos)) {
            return err;
        }
        DecodeError err;
        switch (tag) {
        case make_tag(1, WireType::length_delimited):
            err = decode_string(in, pos, r.sensor, pos);
            break;
        case make_tag(2, WireType::varint):
            err = decode_zigzag32(in, pos, r.delta, pos);
            break;
        case make_tag(3, WireType::fixed64):
            err = decode_double(in, pos, r.value, pos);
            break;
        case make_tag(4, WireType::fixed32): {
            std::uint32_t f = 0;
            err = decode_fixed32(in, pos, f, pos);
            if (!err) {
                r.flags.push_back(f);
            }
            break;
        }
        default:
            // 未知字段：按 wire type 跳过，保持前向兼容。
            err = skip_field(in, pos, tag & 0x7u, pos);
            break;
        }
        if (err) {
            return err;
        }
    }
    return {};
}

} // namespace

int main() {
    std::cout << "=== pbwire 编解码简单示例 ===\n\n";

    core::set_log_level(core::LogLevel::debug);

    const Reading reading{"probe-\xE2\x91\xA0", -42, 21.5, {0x1u, 0x80000000u}};
    auto encoded = encode_reading(reading);

    // 追加一个解码方不认识的字段 9（varint），验证 skip_field。
    encode_key(encoded, make_tag(9, WireType::varint));
    encode_varint(encoded, 123456789);

    std::cout << "编码成功: " << encoded.size() << " 字节\n";
    std::cout << utils::hex_dump(bytes_view{encoded});

    Reading decoded;
    if (auto err = decode_reading(bytes_view{encoded}, decoded)) {
        std::cerr << "解码失败: " << err.message() << "\n";
        return 1;
    }
    std::cout << "解码成功: sensor=\"" << decoded.sensor << "\" delta=" << decoded.delta
              << " value=" << decoded.value << " flags=" << decoded.flags.size() << "\n";

    // 截断输入：在第一个不完整的字段处返回 buffer_overflow。
    Reading partial;
    const auto truncated = bytes_view{encoded}.first(encoded.size() / 2);
    if (auto err = decode_reading(truncated, partial)) {
        std::cout << "截断输入按预期失败: " << err.message() << "\n";
    }
    return 0;
}
