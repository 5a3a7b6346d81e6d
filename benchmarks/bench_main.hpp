#pragma once

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace pbwire::benchmarks {

/**
 * @brief 单项基准结果。
 *
 * - bytes：单次迭代处理的编码字节数（用于 MB/s）
 * - ops：单次迭代编解码的值个数（用于 Mops/s；varint 等小值更关心这个）
 */
struct BenchmarkResult {
    std::string_view name;
    std::size_t bytes;
    std::size_t ops;
    double elapsed_ms;
};

class BenchmarkTimer {
public:
    void start() { start_ = std::chrono::steady_clock::now(); }

    void stop() { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] double elapsed_ms() const {
        const auto ns =
            std::chrono::duration_cast<std::chrono::nanoseconds>(end_ - start_);
        return static_cast<double>(ns.count()) / 1'000'000.0;
    }

private:
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point end_;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

// 防止编译器把基准循环的结果整体优化掉。
template <typename T>
inline void keep(const T &value) {
    asm volatile("" : : "g"(&value) : "memory");
}

/**
 * @brief 执行 iterations 次 func，取最快一次作为结果（排除首轮冷缓存等抖动）。
 */
template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t bytes,
                          std::size_t ops,
                          int iterations,
                          Func &&func) {
    double best_ms = 0.0;
    for (int i = 0; i < iterations; ++i) {
        BenchmarkTimer timer;
        timer.start();
        func();
        timer.stop();
        const double ms = timer.elapsed_ms();
        if (i == 0 || ms < best_ms) {
            best_ms = ms;
        }
    }
    results().push_back({name, bytes, ops, best_ms});
}

inline void print_results() {
    const std::string rule(96, '=');
    std::cout << "\n" << rule << "\n";
    std::cout << "BENCHMARK RESULTS (best of N)\n";
    std::cout << rule << "\n";
    std::cout << std::left << std::setw(46) << "Benchmark" << std::setw(14)
              << "Bytes" << std::setw(12) << "Time (ms)" << std::setw(12)
              << "MB/s" << std::setw(12) << "Mops/s"
              << "\n";
    std::cout << std::string(96, '-') << "\n";

    for (const auto &r : results()) {
        const double seconds = r.elapsed_ms / 1000.0;
        std::cout << std::left << std::setw(46) << r.name << std::setw(14)
                  << r.bytes << std::fixed << std::setprecision(3)
                  << std::setw(12) << r.elapsed_ms;
        if (seconds > 0.0) {
            const double mb = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
            const double mops = static_cast<double>(r.ops) / 1'000'000.0;
            std::cout << std::setw(12) << (mb / seconds) << std::setw(12)
                      << (mops / seconds);
        } else {
            std::cout << std::setw(12) << "N/A" << std::setw(12) << "N/A";
        }
        std::cout << "\n";
    }

    std::cout << rule << "\n\n";
}

} // namespace pbwire::benchmarks

#define BENCH_RUN(name, bytes, ops, iterations, ...)                           \
    ::pbwire::benchmarks::run_benchmark(name, bytes, ops, iterations,          \
                                        [&]() { __VA_ARGS__; })
