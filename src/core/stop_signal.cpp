#include "fmn/core/stop_signal.hpp"

#include <asio/as_tuple.hpp>
#include <asio/error.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

namespace fmn::core {

/*
 * 停止信号的实现要点：
 *
 * - 接收端通过 asio::steady_timer 挂起；send()/关闭 会对所有 waiter 执行
 *   timer->cancel() 来“唤醒”。
 * - 唤醒后一律以共享状态为准判断来源：stopped/sender_closed 置位即视为取消，
 *   即使定时器恰好同时到期，也不会再触发一次通知。
 */
namespace detail {

void StopState::wake_waiters() noexcept {
  for (const auto& timer : waiters) {
    timer->cancel();
  }
}

}  // namespace detail

StopSender& StopSender::operator=(StopSender&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  reset();
  state_ = std::move(other.state_);
  return *this;
}

std::error_code StopSender::send() noexcept {
  if (!state_ || !state_->receiver_alive) {
    return make_error_code(errc::no_receiver);
  }
  state_->stopped = true;
  state_->wake_waiters();
  return {};
}

void StopSender::reset() noexcept {
  if (!state_) {
    return;
  }
  state_->sender_closed = true;
  state_->wake_waiters();
  state_.reset();
}

StopReceiver& StopReceiver::operator=(StopReceiver&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  release_();
  state_ = std::move(other.state_);
  return *this;
}

void StopReceiver::release_() noexcept {
  if (!state_) {
    return;
  }
  state_->receiver_alive = false;
  state_.reset();
}

asio::awaitable<std::error_code> StopReceiver::async_sleep_for(duration d) {
  if (stop_requested()) {
    co_return make_error_code(errc::cancelled);
  }

  // 持有一份共享状态：等待期间即使接收端对象被移动，状态仍然有效。
  auto state = state_;

  auto ex = co_await asio::this_coro::executor;
  auto timer = std::make_shared<asio::steady_timer>(ex);
  timer->expires_after(d);

  auto it = state->waiters.insert(state->waiters.end(), timer);
  auto [ec] = co_await timer->async_wait(asio::as_tuple(asio::use_awaitable));
  state->waiters.erase(it);

  if (state->stopped || state->sender_closed) {
    co_return make_error_code(errc::cancelled);
  }
  if (!ec) {
    co_return std::error_code{};
  }
  if (ec == asio::error::operation_aborted) {
    co_return make_error_code(errc::cancelled);
  }
  co_return ec;
}

std::pair<StopSender, StopReceiver> make_stop_channel() {
  auto state = std::make_shared<detail::StopState>();
  return {StopSender{state}, StopReceiver{state}};
}

}  // namespace fmn::core
