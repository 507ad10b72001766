#pragma once

#include "fmn/core/common.hpp"
#include "fmn/scheduler/clock.hpp"
#include "fmn/scheduler/dispatcher.hpp"
#include "fmn/scheduler/notifier.hpp"
#include "fmn/task/task.hpp"
#include "fmn/task/time.hpp"

#include <asio/io_context.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace fmn::scheduler {

struct SchedulerOptions final {
  // 命令通道容量（背压上界）：通道满时 add_task/cancel_task 阻塞调用线程。
  std::size_t command_capacity{core::kDefaultCommandCapacity};

  // 每日任务单次等待的上限。
  core::duration daily_poll_interval{core::kDefaultDailyPollInterval};

  // 本地时区偏移；为空时在构造时读取一次宿主偏移。
  std::optional<task::UtcOffset> utc_offset{};

  // 墙上时间来源；为空时使用 system_clock::now。
  WallClock wall_clock{};

  // 通知标题。
  std::string summary{"forget-me-not"};
};

/**
 * @brief 调度器门面：供任意线程调用的同步接口。
 *
 * 构造时启动唯一的后台线程，在其上的单线程 io_context 中运行协调循环与所有
 * 定时任务（每个提醒一个协程，而非每个提醒一个线程）。
 *
 * 语义：
 * - add_task/cancel_task 只等待命令进入通道（有空位即返回），不等待协调循环处理；
 * - 调用前不再校验 task.clock（须由上游 validate_clock 保证）；
 * - 后台线程已结束（shutdown 或协调循环异常退出）后，所有调用立即返回
 *   errc::scheduler_unavailable；阻塞中的调用也会被唤醒并返回该错误；
 * - 在后台线程（例如 Notifier 内部）调用会死锁，故直接返回 errc::wrong_thread。
 */
class Scheduler final {
 public:
  explicit Scheduler(std::shared_ptr<Notifier> notifier, SchedulerOptions options = {});
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  [[nodiscard]] std::error_code add_task(task::Task task);
  [[nodiscard]] std::error_code cancel_task(const task::Task& task);
  [[nodiscard]] std::error_code cancel_task(const task::TaskId& task_id);

  [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
  [[nodiscard]] task::UtcOffset utc_offset() const noexcept { return utc_offset_; }

  // 关闭命令通道、取消所有存活任务并等待后台线程退出（可重复调用）。
  // 在后台线程上调用时只关闭通道、不等待；Scheduler 不得在后台线程上析构。
  void shutdown() noexcept;

 private:
  std::error_code submit_(Command command);
  void run_() noexcept;
  void on_loop_exit_() noexcept;

  task::UtcOffset utc_offset_{};
  asio::io_context ioc_{1};
  CommandChannel channel_;
  Dispatcher dispatcher_;

  std::atomic<bool> running_{false};
  std::thread thread_{};
  std::thread::id io_thread_id_{};
  std::mutex shutdown_mu_{};
};

}  // namespace fmn::scheduler
