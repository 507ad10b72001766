#pragma once

#include "fmn/core/common.hpp"
#include "fmn/task/time.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <variant>

namespace fmn::task {

// 任务标识：创建时分配的全局唯一不透明字符串，永不复用。
using TaskId = std::string;

// 在绝对时刻触发一次。
struct Once final {
  core::time_point at{};
};

// 每经过 every 触发一次，直到被取消。
struct Period final {
  core::duration every{};
};

// 每个自然日在本地时间 hour:minute 触发一次，直到被取消。
struct OncePerDay final {
  std::uint8_t hour{0};
  std::uint8_t minute{0};
};

using ClockType = std::variant<Once, Period, OncePerDay>;

/**
 * @brief 提醒任务（创建后不可变）。
 *
 * created_at 仅作元数据（用于列表排序/展示），不参与调度计算。
 */
struct Task final {
  TaskId id{};
  std::string description{};
  ClockType clock{Once{}};
  core::time_point created_at{};
  std::optional<std::string> image_path{};
  std::optional<std::string> sound_path{};

  // 分配新标识与创建时间。clock 须已通过 validate_clock 校验。
  [[nodiscard]] static Task create(
    std::string description,
    ClockType clock,
    std::optional<std::string> image_path = std::nullopt,
    std::optional<std::string> sound_path = std::nullopt);
};

// 21 字符 URL 安全随机标识（A-Z a-z 0-9 _ -）。
[[nodiscard]] TaskId generate_task_id();

// 周期 <= 0 -> invalid_duration；hour > 23 / minute > 59 -> invalid_time。
std::error_code validate_clock(const ClockType& clock) noexcept;

// "at 2024-05-01 13:30" / "every 90 secs" / "at 07:05 every day"
[[nodiscard]] std::string to_string(const ClockType& clock, UtcOffset offset);

}  // namespace fmn::task
