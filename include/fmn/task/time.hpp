#pragma once

#include "fmn/core/common.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace fmn::task {

/**
 * @brief 固定的本地时区偏移：local = utc + value。
 *
 * 调度器只在启动时捕获一次偏移，之后不再随夏令时等变化重新解析。
 */
struct UtcOffset final {
  std::chrono::minutes value{0};

  friend bool operator==(const UtcOffset&, const UtcOffset&) = default;
};

struct HourMinute final {
  std::uint8_t hour{0};
  std::uint8_t minute{0};

  friend bool operator==(const HourMinute&, const HourMinute&) = default;
};

// 读取宿主当前的本地时区偏移（localtime_r 的 tm_gmtoff）。
[[nodiscard]] UtcOffset current_local_offset() noexcept;

[[nodiscard]] HourMinute local_hour_minute(core::time_point t, UtcOffset offset) noexcept;

// 严格晚于 now、且本地时间为 hour:minute:00 的第一个绝对时刻。
// 跨日/负偏移的回绕通过按“本地日”向下取整处理，不做字段级加减。
[[nodiscard]] core::time_point next_daily_occurrence(
  core::time_point now,
  std::uint8_t hour,
  std::uint8_t minute,
  UtcOffset offset) noexcept;

// "YYYY-MM-DD HH:MM"（按给定偏移换算成本地时间）。
[[nodiscard]] std::string format_local(core::time_point t, UtcOffset offset);

// 可解析时长的上限（约 100 年）：保证换算成纳秒时长、并与当前时刻相加时都不溢出。
inline constexpr std::chrono::seconds kMaxDuration = std::chrono::days{36500};

/**
 * @brief 解析时长："1d2h3m4s"。
 *
 * 各分量均可省略但顺序固定（d, h, m, s），数字仅限十进制；空串解析为 0，
 * 是否允许 0 由上层决定。格式错误或超过 kMaxDuration 返回 errc::invalid_duration。
 */
std::error_code parse_duration(std::string_view text, std::chrono::seconds& out) noexcept;

// "H:MM" / "HH:MM"（可带 ":SS"，秒被忽略）；越界返回 errc::invalid_time。
std::error_code parse_hour_minute(std::string_view text, HourMinute& out) noexcept;

// 解析 "HH:MM" 并换算成下一次出现的绝对时刻（今天已过则顺延到明天）。
std::error_code parse_at(
  std::string_view text,
  core::time_point now,
  UtcOffset offset,
  core::time_point& out) noexcept;

}  // namespace fmn::task
