#pragma once

#include <spdlog/logger.h>

namespace pbwire::core::detail {

/**
 * @brief 库内部使用的 spdlog logger（名为 "pbwire"）。
 *
 * 由默认 logger 克隆而来：沿用业务侧配置的 sink/pattern，
 * 但级别独立，由 core::set_log_level 控制，不影响业务侧的全局级别。
 */
spdlog::logger& logger();

} // namespace pbwire::core::detail
