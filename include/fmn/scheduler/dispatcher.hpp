#pragma once

#include "fmn/core/stop_signal.hpp"
#include "fmn/scheduler/clock.hpp"
#include "fmn/task/task.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/concurrent_channel.hpp>

#include <cstddef>
#include <exception>
#include <system_error>
#include <unordered_map>
#include <variant>

namespace fmn::scheduler {

struct AddCommand final {
  task::Task task;
};

struct CancelCommand final {
  task::TaskId task_id;
};

using Command = std::variant<AddCommand, CancelCommand>;

// 门面与协调循环之间的有界命令通道（满时发送方阻塞，不丢弃）。
using CommandChannel = asio::experimental::concurrent_channel<void(std::error_code, Command)>;

/**
 * @brief 协调循环：串行处理 Add/Cancel，唯一持有并修改取消登记表。
 *
 * 约定：
 * - 所有成员函数都只在 executor 所在的（单）线程上调用，登记表无需加锁。
 * - add_task：登记 (id -> StopSender) 后 co_spawn 对应定时任务，不等待其结束。
 * - cancel_task：尽力而为且幂等；未知标识或停止信号无人接收只记录日志。
 * - 定时任务自行结束（Once 已触发/已过期、循环任务因通知失败终止）时，
 *   由其完成回调从登记表中移除对应条目，避免一次性任务无限累积。
 */
class Dispatcher final {
 public:
  Dispatcher(asio::any_io_executor ex, ClockContext context);

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  [[nodiscard]] asio::any_io_executor executor() const noexcept { return executor_; }

  // 主循环：逐条接收命令，通道关闭（或出错）时返回；处理命令抛出异常时先停止所有存活任务再向外传播。
  asio::awaitable<void> async_run(CommandChannel& channel);

  void handle(Command command);
  void add_task(task::Task task);
  void cancel_task(const task::TaskId& id);

  // 丢弃全部发送端：所有存活任务在下一个挂起点观察到取消。
  void stop_all() noexcept;

  [[nodiscard]] std::size_t live_tasks() const noexcept { return registry_.size(); }
  [[nodiscard]] bool contains(const task::TaskId& id) const { return registry_.count(id) != 0; }

 private:
  void on_clock_done_(const task::TaskId& id, std::exception_ptr e) noexcept;

  asio::any_io_executor executor_{};
  ClockContext context_{};
  std::unordered_map<task::TaskId, core::StopSender> registry_{};
};

}  // namespace fmn::scheduler
