#include "pbwire/utils/hex.hpp"

#include <algorithm>

namespace pbwire::utils {
namespace {

constexpr char kDigits[] = "0123456789abcdef";

[[nodiscard]] int nibble_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] bool is_separator(char c) noexcept {
    switch (c) {
    case ' ':
    case '\t':
    case '\r':
    case '\n':
    case ',':
    case ':':
    case '-':
        return true;
    default:
        return false;
    }
}

void append_byte(std::string& s, core::byte b) {
    s.push_back(kDigits[(b >> 4) & 0x0F]);
    s.push_back(kDigits[b & 0x0F]);
}

void append_offset(std::string& s, std::size_t offset) {
    // 至少 4 位，不足补 0。
    std::string digits;
    do {
        digits.push_back(kDigits[offset & 0x0F]);
        offset >>= 4;
    } while (offset != 0);
    while (digits.size() < 4) {
        digits.push_back('0');
    }
    s.append(digits.rbegin(), digits.rend());
    s.append(": ");
}

} // namespace

std::string hex_dump(core::bytes_view bytes, HexDumpOptions options) {
    const std::size_t total = bytes.size();
    const std::size_t limit =
        options.max_bytes == 0 ? total : std::min(total, options.max_bytes);
    const std::size_t per_line =
        options.bytes_per_line == 0 ? std::size_t{16} : options.bytes_per_line;

    std::string out;
    for (std::size_t offset = 0; offset < limit; offset += per_line) {
        const std::size_t line_n = std::min(per_line, limit - offset);
        if (options.show_offset) {
            append_offset(out, offset);
        }
        for (std::size_t i = 0; i < line_n; ++i) {
            if (i != 0) {
                out.push_back(' ');
            }
            append_byte(out, bytes[offset + i]);
        }
        out.push_back('\n');
    }

    if (limit < total) {
        out.append("... (truncated, total=");
        out.append(std::to_string(total));
        out.append(" bytes)\n");
    }
    return out;
}

std::string to_hex(core::bytes_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 3);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i != 0) {
            out.push_back(' ');
        }
        append_byte(out, bytes[i]);
    }
    return out;
}

std::error_code parse_hex(std::string_view text, std::vector<core::byte>& out) noexcept {
    out.clear();

    int high = -1;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (is_separator(c)) {
            continue;
        }
        // 仅在字节边界识别 0x 前缀，避免把 "0x" 的 '0' 当作数据。
        if (c == '0' && high < 0 && i + 1 < text.size() &&
            (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            ++i;
            continue;
        }
        const int v = nibble_value(c);
        if (v < 0) {
            out.clear();
            return core::make_error_code(core::errc::invalid_data);
        }
        if (high < 0) {
            high = v;
            continue;
        }
        out.push_back(static_cast<core::byte>((high << 4) | v));
        high = -1;
    }

    if (high >= 0) {
        out.clear();
        return core::make_error_code(core::errc::invalid_data);
    }
    return {};
}

} // namespace pbwire::utils
