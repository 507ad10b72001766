#include "fmn/scheduler/scheduler.hpp"

#include "fmn/core/error.hpp"

#include <asio/co_spawn.hpp>
#include <asio/use_future.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace fmn::scheduler {
namespace {

using core::errc;
using core::make_error_code;

[[nodiscard]] ClockContext make_context(
  std::shared_ptr<Notifier> notifier,
  SchedulerOptions& options,
  task::UtcOffset offset) {
  if (!notifier) {
    spdlog::warn("no notifier given, fall back to log-only notifications");
    notifier = std::make_shared<LogNotifier>();
  }

  ClockContext ctx{};
  ctx.notifier = std::move(notifier);
  ctx.utc_offset = offset;
  ctx.wall_clock = std::move(options.wall_clock);
  ctx.daily_poll_interval = options.daily_poll_interval;
  ctx.summary = std::move(options.summary);
  return ctx;
}

}  // namespace

Scheduler::Scheduler(std::shared_ptr<Notifier> notifier, SchedulerOptions options)
  : utc_offset_(options.utc_offset.value_or(task::current_local_offset())),
    channel_(ioc_, options.command_capacity),
    dispatcher_(ioc_.get_executor(), make_context(std::move(notifier), options, utc_offset_)) {
  asio::co_spawn(ioc_, dispatcher_.async_run(channel_), [this](std::exception_ptr e) {
    if (e) {
      try {
        std::rethrow_exception(e);
      } catch (const std::exception& ex) {
        spdlog::critical("scheduler loop crashed: {}", ex.what());
      } catch (...) {
        spdlog::critical("scheduler loop crashed with unknown exception");
      }
    }
    on_loop_exit_();
  });

  running_ = true;
  thread_ = std::thread([this] { run_(); });
  io_thread_id_ = thread_.get_id();
}

Scheduler::~Scheduler() { shutdown(); }

std::error_code Scheduler::add_task(task::Task task) {
  const auto id = task.id;
  auto ec = submit_(AddCommand{std::move(task)});
  if (!ec) {
    spdlog::debug("successfully send new task {} to scheduler loop", id);
  }
  return ec;
}

std::error_code Scheduler::cancel_task(const task::Task& task) {
  return cancel_task(task.id);
}

std::error_code Scheduler::cancel_task(const task::TaskId& task_id) {
  auto ec = submit_(CancelCommand{task_id});
  if (!ec) {
    spdlog::debug("successfully send cancel of task {} to scheduler loop", task_id);
  }
  return ec;
}

void Scheduler::shutdown() noexcept {
  // 后台线程上（例如 Notifier 内部）无法 join 自己：只关闭通道让循环收尾，
  // 线程留给拥有者线程随后的 shutdown()/析构回收。
  if (std::this_thread::get_id() == io_thread_id_) {
    spdlog::warn("scheduler shutdown requested from its own thread, only close the command channel");
    running_ = false;
    channel_.close();
    return;
  }

  std::lock_guard lk(shutdown_mu_);

  // 关闭通道：协调循环收到 channel_closed 后停止全部任务，io_context 随之跑空返回。
  channel_.close();

  if (thread_.joinable()) {
    thread_.join();
  }
  running_ = false;
}

std::error_code Scheduler::submit_(Command command) {
  // 后台线程已退出：确定性地失败，不阻塞也不“假成功”。
  if (!running_.load() || !channel_.is_open()) {
    return make_error_code(errc::scheduler_unavailable);
  }
  if (std::this_thread::get_id() == io_thread_id_) {
    return make_error_code(errc::wrong_thread);
  }

  try {
    // 有空位即完成；通道满时阻塞到协调循环取走命令，通道关闭时抛出 system_error。
    channel_.async_send(std::error_code{}, std::move(command), asio::use_future).get();
  } catch (const std::system_error& e) {
    spdlog::error("fail to send command to scheduler loop: {}", e.what());
    return make_error_code(errc::scheduler_unavailable);
  }
  return {};
}

void Scheduler::run_() noexcept {
  try {
    ioc_.run();
  } catch (const std::exception& e) {
    spdlog::critical("scheduler thread terminated by exception: {}", e.what());
  }
  on_loop_exit_();
  spdlog::info("scheduler thread exits");
}

void Scheduler::on_loop_exit_() noexcept {
  running_ = false;
  channel_.close();
}

}  // namespace fmn::scheduler
