#pragma once

#include "fmn/core/common.hpp"
#include "fmn/core/error.hpp"

#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>

#include <list>
#include <memory>
#include <system_error>
#include <utility>

namespace fmn::core {

namespace detail {

// 发送端与接收端共享的一次性停止状态（只在调度线程上访问，无需加锁）。
struct StopState final {
  bool stopped{false};
  bool sender_closed{false};
  bool receiver_alive{true};
  std::list<std::shared_ptr<asio::steady_timer>> waiters{};

  void wake_waiters() noexcept;
};

}  // namespace detail

class StopReceiver;

/**
 * @brief 一次性停止信号的发送端（由协调循环持有）。
 *
 * 语义：
 * - send()：置位停止并唤醒接收端；接收端已销毁（任务已自行结束）时返回
 *   no_receiver，调用方只需记录日志。
 * - 析构/reset()：关闭通道；接收端把“通道关闭”视同取消。
 */
class StopSender final {
 public:
  StopSender() = default;
  explicit StopSender(std::shared_ptr<detail::StopState> state) noexcept : state_(std::move(state)) {}

  StopSender(const StopSender&) = delete;
  StopSender& operator=(const StopSender&) = delete;

  StopSender(StopSender&& other) noexcept : state_(std::move(other.state_)) {}
  StopSender& operator=(StopSender&& other) noexcept;

  ~StopSender() { reset(); }

  std::error_code send() noexcept;
  void reset() noexcept;

  [[nodiscard]] bool has_receiver() const noexcept { return state_ && state_->receiver_alive; }

 private:
  std::shared_ptr<detail::StopState> state_{};
};

/**
 * @brief 一次性停止信号的接收端（由单个定时任务持有）。
 *
 * async_sleep_for(d) 即“竞速”原语：等待 d 到期与停止信号二者先到者。
 * - d 先到期：返回成功
 * - 收到停止或通道已关闭：返回 cancelled（等待前已停止则立即返回）
 * 取消是协作式的：任务只在该挂起点观察到停止。
 */
class StopReceiver final {
 public:
  StopReceiver() = default;
  explicit StopReceiver(std::shared_ptr<detail::StopState> state) noexcept : state_(std::move(state)) {}

  StopReceiver(const StopReceiver&) = delete;
  StopReceiver& operator=(const StopReceiver&) = delete;

  StopReceiver(StopReceiver&& other) noexcept : state_(std::move(other.state_)) {}
  StopReceiver& operator=(StopReceiver&& other) noexcept;

  ~StopReceiver() { release_(); }

  [[nodiscard]] bool stop_requested() const noexcept {
    return !state_ || state_->stopped || state_->sender_closed;
  }

  asio::awaitable<std::error_code> async_sleep_for(duration d);

 private:
  void release_() noexcept;

  std::shared_ptr<detail::StopState> state_{};
};

[[nodiscard]] std::pair<StopSender, StopReceiver> make_stop_channel();

}  // namespace fmn::core
