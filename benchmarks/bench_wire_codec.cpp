#include "bench_main.hpp"

#include "pbwire/wire/fixed.hpp"
#include "pbwire/wire/length_delimited.hpp"
#include "pbwire/wire/skip.hpp"
#include "pbwire/wire/varint.hpp"
#include "pbwire/wire/zigzag.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using namespace pbwire;
using namespace pbwire::wire;

namespace {

constexpr std::size_t kValueCount = 100000;
constexpr int kIterations = 5;

// 覆盖 1..10 字节的 varint 长度分布。
std::vector<std::uint64_t> make_varint_values() {
    std::vector<std::uint64_t> values;
    values.reserve(kValueCount);
    for (std::size_t i = 0; i < kValueCount; ++i) {
        const auto shift = static_cast<unsigned>((i * 7) % 64);
        values.push_back((std::uint64_t{1} << shift) + i);
    }
    return values;
}

void report(const DecodeError &err, const char *what) {
    if (err) {
        std::cerr << what << " failed: " << err.message() << "\n";
    }
}

void bench_varint() {
    const auto values = make_varint_values();
    std::vector<byte> encoded;
    std::size_t total = 0;
    for (const auto v : values) {
        total += varint_size(v);
    }
    encoded.reserve(total);

    BENCH_RUN("varint: encode (100k mixed widths)", total, kValueCount, kIterations, {
        encoded.clear();
        for (const auto v : values) {
            encode_varint(encoded, v);
        }
    });

    const bytes_view in{encoded};
    BENCH_RUN("varint: decode (100k mixed widths)", in.size(), kValueCount, kIterations, {
        std::size_t pos = 0;
        std::uint64_t sum = 0;
        while (pos < in.size()) {
            std::uint64_t v = 0;
            const auto err = decode_varint(in, pos, v, pos);
            if (err) {
                report(err, "varint decode");
                break;
            }
            sum += v;
        }
        benchmarks::keep(sum);
    });
}

void bench_zigzag() {
    std::vector<byte> encoded;
    BENCH_RUN("zigzag64: encode (100k, +/- small)", kValueCount * 2, kValueCount, kIterations, {
        encoded.clear();
        for (std::size_t i = 0; i < kValueCount; ++i) {
            const auto v = static_cast<std::int64_t>(i) - static_cast<std::int64_t>(kValueCount / 2);
            encode_zigzag64(encoded, v);
        }
    });

    const bytes_view in{encoded};
    BENCH_RUN("zigzag64: decode (100k, +/- small)", in.size(), kValueCount, kIterations, {
        std::size_t pos = 0;
        std::int64_t sum = 0;
        while (pos < in.size()) {
            std::int64_t v = 0;
            const auto err = decode_zigzag64(in, pos, v, pos);
            if (err) {
                report(err, "zigzag decode");
                break;
            }
            sum += v;
        }
        benchmarks::keep(sum);
    });
}

void bench_fixed() {
    std::vector<byte> encoded;
    encoded.reserve(kValueCount * core::kFixed64Size);
    BENCH_RUN("fixed64: encode (100k)", kValueCount * core::kFixed64Size, kValueCount, kIterations, {
        encoded.clear();
        for (std::size_t i = 0; i < kValueCount; ++i) {
            encode_fixed64(encoded, 0x0123456789ABCDEFull ^ i);
        }
    });

    const bytes_view in{encoded};
    BENCH_RUN("fixed64: decode (100k)", in.size(), kValueCount, kIterations, {
        std::size_t pos = 0;
        std::uint64_t acc = 0;
        while (pos < in.size()) {
            std::uint64_t v = 0;
            const auto err = decode_fixed64(in, pos, v, pos);
            if (err) {
                report(err, "fixed64 decode");
                break;
            }
            acc ^= v;
        }
        benchmarks::keep(acc);
    });
}

void bench_length_delimited() {
    constexpr std::size_t count = 10000;
    const std::string text(64, 'x');
    std::vector<byte> encoded;
    BENCH_RUN("string: encode (10k x 64B)", count * 65, count, kIterations, {
        encoded.clear();
        for (std::size_t i = 0; i < count; ++i) {
            encode_string(encoded, text);
        }
    });

    const bytes_view in{encoded};
    BENCH_RUN("string: decode + utf8 check (10k x 64B)", in.size(), count, kIterations, {
        std::size_t pos = 0;
        std::string s;
        while (pos < in.size()) {
            const auto err = decode_string(in, pos, s, pos);
            if (err) {
                report(err, "string decode");
                break;
            }
        }
        benchmarks::keep(s);
    });

    BENCH_RUN("bytes: skip_field (10k x 64B)", in.size(), count, kIterations, {
        std::size_t pos = 0;
        while (pos < in.size()) {
            const auto err = skip_field(in, pos, 2, pos);
            if (err) {
                report(err, "skip");
                break;
            }
        }
        benchmarks::keep(pos);
    });
}

} // namespace

int main() {
    bench_varint();
    bench_zigzag();
    bench_fixed();
    bench_length_delimited();

    pbwire::benchmarks::print_results();
    return 0;
}
