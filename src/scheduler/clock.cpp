#include "fmn/scheduler/clock.hpp"

#include "fmn/core/error.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <string_view>
#include <utility>

namespace fmn::scheduler {
namespace {

using core::errc;
using core::make_error_code;

// 每日任务的匹配窗口：目标分钟内醒来才触发。
constexpr auto kDailyFireWindow = std::chrono::minutes{1};

[[nodiscard]] core::duration until(core::time_point target, core::time_point now) noexcept {
  if (target <= now) {
    return core::duration::zero();
  }
  return std::chrono::duration_cast<core::duration>(target - now);
}

[[nodiscard]] long long whole_seconds(core::duration d) noexcept {
  return std::chrono::duration_cast<std::chrono::seconds>(d).count();
}

void log_wait_end(const task::Task& task, std::string_view kind, const std::error_code& ec) {
  if (ec == make_error_code(errc::cancelled)) {
    spdlog::info("{} task {} is cancelled", kind, task.id);
    return;
  }
  spdlog::error("{} task {} stops on wait error: {}", kind, task.id, ec.message());
}

}  // namespace

std::error_code fire(const task::Task& task, const ClockContext& ctx) {
  if (!ctx.notifier) {
    return make_error_code(errc::notify_failed);
  }
  return ctx.notifier->notify(ctx.summary, task.description, task.image_path, task.sound_path);
}

asio::awaitable<void> async_once_clock(
  task::Task task,
  core::time_point fire_at,
  core::StopReceiver stop,
  ClockContext ctx) {
  const auto now = ctx.now();
  if (fire_at <= now) {
    spdlog::warn(
      "once task {} fire time {} is in the past, skip it",
      task.id,
      task::format_local(fire_at, ctx.utc_offset));
    co_return;
  }

  auto ec = co_await stop.async_sleep_for(until(fire_at, now));
  if (ec) {
    log_wait_end(task, "once", ec);
    co_return;
  }

  spdlog::info("once task {} fire: {}", task.id, task.description);
  if (auto notify_ec = fire(task, ctx)) {
    spdlog::error("fail to send notification for once task {}: {}", task.id, notify_ec.message());
  }
}

asio::awaitable<void> async_period_clock(
  task::Task task,
  core::duration every,
  core::StopReceiver stop,
  ClockContext ctx) {
  // 截止时间按 start + k*every 累加，避免通知耗时造成的漂移。
  auto deadline = core::steady_clock::now() + every;

  for (;;) {
    const auto now = core::steady_clock::now();
    const auto wait = deadline > now ? deadline - now : core::duration::zero();

    auto ec = co_await stop.async_sleep_for(wait);
    if (ec) {
      log_wait_end(task, "periodic", ec);
      co_return;
    }

    spdlog::info("periodic task {} (every {} secs) fire: {}", task.id, whole_seconds(every), task.description);
    if (auto notify_ec = fire(task, ctx)) {
      spdlog::error(
        "fail to send notification for periodic task {}: {}; stop all future fires",
        task.id,
        notify_ec.message());
      co_return;
    }

    deadline += every;
    const auto after = core::steady_clock::now();
    if (deadline <= after) {
      // 落后超过一个周期：跳到下一个未来的截止点，不补发。
      deadline += every * ((after - deadline) / every + 1);
    }
  }
}

asio::awaitable<void> async_daily_clock(
  task::Task task,
  std::uint8_t hour,
  std::uint8_t minute,
  core::StopReceiver stop,
  ClockContext ctx) {
  auto next = task::next_daily_occurrence(ctx.now(), hour, minute, ctx.utc_offset);
  spdlog::info("daily task {} armed for {}", task.id, task::format_local(next, ctx.utc_offset));

  for (;;) {
    auto wait = until(next, ctx.now());
    if (ctx.daily_poll_interval > core::duration::zero()) {
      wait = std::min(wait, ctx.daily_poll_interval);
    }

    auto ec = co_await stop.async_sleep_for(wait);
    if (ec) {
      log_wait_end(task, "daily", ec);
      co_return;
    }

    const auto now = ctx.now();
    if (now < next) {
      continue;
    }

    if (now - next < kDailyFireWindow) {
      spdlog::info("daily task {} at {:02}:{:02} fire: {}", task.id, hour, minute, task.description);
      if (auto notify_ec = fire(task, ctx)) {
        spdlog::error(
          "fail to send notification for daily task {}: {}; stop all future fires",
          task.id,
          notify_ec.message());
        co_return;
      }
    } else {
      spdlog::warn(
        "daily task {} missed its window at {}",
        task.id,
        task::format_local(next, ctx.utc_offset));
    }

    // 从 now（>= 已处理的时刻）起算，下一次必然落在之后的某一天。
    next = task::next_daily_occurrence(now, hour, minute, ctx.utc_offset);
    spdlog::debug("daily task {} re-armed for {}", task.id, task::format_local(next, ctx.utc_offset));
  }
}

asio::awaitable<void> async_run_clock(task::Task task, core::StopReceiver stop, ClockContext ctx) {
  if (const auto* once = std::get_if<task::Once>(&task.clock)) {
    const auto at = once->at;
    co_await async_once_clock(std::move(task), at, std::move(stop), std::move(ctx));
  } else if (const auto* period = std::get_if<task::Period>(&task.clock)) {
    const auto every = period->every;
    co_await async_period_clock(std::move(task), every, std::move(stop), std::move(ctx));
  } else if (const auto* daily = std::get_if<task::OncePerDay>(&task.clock)) {
    const auto hour = daily->hour;
    const auto minute = daily->minute;
    co_await async_daily_clock(std::move(task), hour, minute, std::move(stop), std::move(ctx));
  }
}

}  // namespace fmn::scheduler
