#pragma once

#include "fmn/core/common.hpp"
#include "fmn/core/stop_signal.hpp"
#include "fmn/scheduler/notifier.hpp"
#include "fmn/task/task.hpp"
#include "fmn/task/time.hpp"

#include <asio/awaitable.hpp>

#include <functional>
#include <memory>
#include <string>
#include <system_error>

namespace fmn::scheduler {

// 墙上时间来源（测试可注入偏移后的时钟）。
using WallClock = std::function<core::time_point()>;

/**
 * @brief 定时任务运行所需的共享上下文（由协调循环按值传给每个任务）。
 */
struct ClockContext final {
  std::shared_ptr<Notifier> notifier{};
  task::UtcOffset utc_offset{};
  WallClock wall_clock{};
  core::duration daily_poll_interval{core::kDefaultDailyPollInterval};
  std::string summary{"forget-me-not"};

  [[nodiscard]] core::time_point now() const {
    return wall_clock ? wall_clock() : core::system_clock::now();
  }
};

// 调用通知器并记录结果；返回通知器报告的错误。
std::error_code fire(const task::Task& task, const ClockContext& ctx);

/*
 * 三种定时行为。均只在 StopReceiver::async_sleep_for 处挂起，
 * 返回即表示该任务生命周期结束（自然完成、被取消或因通知失败终止）。
 */

// 目标时刻已过（<= now）时记录日志并直接结束，不触发。
asio::awaitable<void> async_once_clock(
  task::Task task,
  core::time_point fire_at,
  core::StopReceiver stop,
  ClockContext ctx);

// 按 start + k*every 的绝对截止时间循环触发；通知失败即终止。
asio::awaitable<void> async_period_clock(
  task::Task task,
  core::duration every,
  core::StopReceiver stop,
  ClockContext ctx);

/**
 * @brief 每日定点任务。
 *
 * - 计算下一次出现的绝对时刻，等待时长不超过 daily_poll_interval，醒来后按
 *   墙上时间重新核对（可察觉系统时间跳变）；
 * - 只在匹配的那一分钟内触发，错过整分钟窗口则记录日志并顺延；
 * - 触发后从已触发的时刻重新计算下一次（严格晚于它），保证每天至多一次；
 * - 通知失败即终止。
 */
asio::awaitable<void> async_daily_clock(
  task::Task task,
  std::uint8_t hour,
  std::uint8_t minute,
  core::StopReceiver stop,
  ClockContext ctx);

// 按 task.clock 分派到上面三种行为之一。
asio::awaitable<void> async_run_clock(task::Task task, core::StopReceiver stop, ClockContext ctx);

}  // namespace fmn::scheduler
