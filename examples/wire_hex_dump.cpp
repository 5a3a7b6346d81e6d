/**
 * @file wire_hex_dump.cpp
 * @brief 解析命令行给出的 16 进制字节流，逐字段输出 tag / wire type / 原始字节
 *
 * 用法：
 *   wire_hex_dump "08 96 01 12 03 61 62 63"
 *
 * 不认识任何 schema：每个字段只通过 skip_field 定位边界。
 */

#include <pbwire/utils/hex.hpp>
#include <pbwire/wire/skip.hpp>
#include <pbwire/wire/types.hpp>
#include <pbwire/wire/varint.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace pbwire;

int main(int argc, char **argv) {
    const std::string text = argc > 1 ? argv[1] : "08 96 01 12 03 61 62 63 1d 00 00 80 3f";

    std::vector<byte> data;
    if (auto ec = utils::parse_hex(text, data)) {
        std::cerr << "非法的 16 进制输入: " << ec.message() << "\n";
        return 2;
    }

    const bytes_view in{data};
    std::cout << "输入 " << in.size() << " 字节\n" << utils::hex_dump(in) << "\n";

    std::size_t pos = 0;
    while (pos < in.size()) {
        const std::size_t field_start = pos;
        std::uint64_t tag = 0;
        if (auto err = wire::decode_key(in, pos, tag, pos)) {
            std::cerr << "offset " << field_start << ": " << err.message() << "\n";
            return 1;
        }

        const std::uint64_t raw_type = tag & 0x7u;
        const auto type = wire::wire_type_from_value(raw_type);
        const std::size_t value_start = pos;
        if (auto err = wire::skip_field(in, pos, raw_type, pos)) {
            std::cerr << "offset " << value_start << ": " << err.message() << "\n";
            return 1;
        }

        std::cout << "field " << (tag >> 3) << " ["
                  << (type ? wire::to_string(*type) : std::string_view{"?"}) << "] "
                  << utils::to_hex(in.subspan(value_start, pos - value_start)) << "\n";
    }
    return 0;
}
