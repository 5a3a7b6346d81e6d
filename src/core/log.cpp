#include "pbwire/core/log.hpp"

#include "log_internal.hpp"

#include <spdlog/spdlog.h>

#include <memory>

namespace pbwire::core {
namespace {

// 默认只输出 warn 及以上：库的 debug 诊断需显式打开。
constexpr LogLevel kDefaultLevel = LogLevel::warn;

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::trace:
        return spdlog::level::trace;
    case LogLevel::debug:
        return spdlog::level::debug;
    case LogLevel::info:
        return spdlog::level::info;
    case LogLevel::warn:
        return spdlog::level::warn;
    case LogLevel::error:
        return spdlog::level::err;
    case LogLevel::critical:
        return spdlog::level::critical;
    case LogLevel::off:
        return spdlog::level::off;
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::trace;
    case spdlog::level::debug:
        return LogLevel::debug;
    case spdlog::level::info:
        return LogLevel::info;
    case spdlog::level::warn:
        return LogLevel::warn;
    case spdlog::level::err:
        return LogLevel::error;
    case spdlog::level::critical:
        return LogLevel::critical;
    default:
        return LogLevel::off;
    }
}

std::shared_ptr<spdlog::logger> make_library_logger() {
    auto lib = spdlog::default_logger()->clone("pbwire");
    lib->set_level(to_spdlog_level(kDefaultLevel));
    return lib;
}

} // namespace

namespace detail {

spdlog::logger& logger() {
    // 函数内静态对象：首次调用时构造，C++11 起保证线程安全初始化。
    static const std::shared_ptr<spdlog::logger> instance = make_library_logger();
    return *instance;
}

} // namespace detail

void set_log_level(LogLevel level) noexcept {
    detail::logger().set_level(to_spdlog_level(level));
}

LogLevel log_level() noexcept { return from_spdlog_level(detail::logger().level()); }

} // namespace pbwire::core
