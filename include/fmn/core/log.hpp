#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace fmn::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 本库内部日志使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 业务侧可通过 set_log_level 调整全局日志级别。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

// 解析级别名（大小写不敏感；warning 等同 warn），无法识别时返回 nullopt。
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// 安装统一的输出格式；给出 level 时同时设置全局级别。
void init_logging(std::optional<LogLevel> level = std::nullopt);

} // namespace fmn::core
