#include "fmn/scheduler/dispatcher.hpp"

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/experimental/channel_error.hpp>
#include <asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace fmn::scheduler {

Dispatcher::Dispatcher(asio::any_io_executor ex, ClockContext context)
  : executor_(std::move(ex)), context_(std::move(context)) {}

asio::awaitable<void> Dispatcher::async_run(CommandChannel& channel) {
  for (;;) {
    auto [ec, command] = co_await channel.async_receive(asio::as_tuple(asio::use_awaitable));
    if (ec) {
      if (ec == asio::experimental::error::channel_closed || ec == asio::experimental::error::channel_cancelled) {
        spdlog::info("command channel closed, dispatcher exits");
      } else {
        spdlog::error("fail to receive scheduler command: {}", ec.message());
      }
      break;
    }
    try {
      handle(std::move(command));
    } catch (...) {
      // 循环异常退出时也要丢弃全部发送端，否则存活任务让 io_context 永不跑空。
      stop_all();
      throw;
    }
  }
  stop_all();
}

void Dispatcher::handle(Command command) {
  if (auto* add = std::get_if<AddCommand>(&command)) {
    add_task(std::move(add->task));
  } else if (auto* cancel = std::get_if<CancelCommand>(&command)) {
    cancel_task(cancel->task_id);
  }
}

void Dispatcher::add_task(task::Task task) {
  if (registry_.count(task.id) != 0) {
    spdlog::warn("task {} is already scheduled, ignore duplicated add", task.id);
    return;
  }

  spdlog::info("add new clock task: {}, {}", task.id, task::to_string(task.clock, context_.utc_offset));

  auto [sender, receiver] = core::make_stop_channel();
  auto id = task.id;
  registry_.emplace(id, std::move(sender));

  asio::co_spawn(
    executor_,
    async_run_clock(std::move(task), std::move(receiver), context_),
    [this, id = std::move(id)](std::exception_ptr e) { on_clock_done_(id, e); });
}

void Dispatcher::cancel_task(const task::TaskId& id) {
  auto it = registry_.find(id);
  if (it == registry_.end()) {
    // 未知或已结束的任务：取消视为成功的空操作。
    spdlog::warn("fail to find stop channel for task id: {}", id);
    return;
  }

  if (auto ec = it->second.send()) {
    spdlog::error("fail to send stop to task {}: {}", id, ec.message());
  } else {
    spdlog::info("stop sent to task {}", id);
  }
  registry_.erase(it);
}

void Dispatcher::stop_all() noexcept {
  if (!registry_.empty()) {
    spdlog::info("stop {} live task(s)", registry_.size());
  }
  registry_.clear();
}

void Dispatcher::on_clock_done_(const task::TaskId& id, std::exception_ptr e) noexcept {
  if (e) {
    try {
      std::rethrow_exception(e);
    } catch (const std::exception& ex) {
      spdlog::error("clock task {} terminated by exception: {}", id, ex.what());
    } catch (...) {
      spdlog::error("clock task {} terminated by unknown exception", id);
    }
  }

  if (registry_.erase(id) != 0) {
    spdlog::debug("prune finished task {}", id);
  }
}

}  // namespace fmn::scheduler
