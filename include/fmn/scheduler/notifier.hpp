#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace fmn::scheduler {

/**
 * @brief 通知协作者：负责把一次“触发”呈现给用户。
 *
 * 调度核心只关心返回值：
 * - Once：失败仅记录日志
 * - Period/OncePerDay：失败即终止该任务后续所有触发（不重试）
 *
 * notify() 在调度线程上被调用，实现不应长时间阻塞。
 */
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual std::error_code notify(
    std::string_view summary,
    std::string_view body,
    const std::optional<std::string>& image,
    const std::optional<std::string>& sound) = 0;
};

// 只写日志的通知器（无桌面环境/测试用），总是成功。
class LogNotifier final : public Notifier {
 public:
  std::error_code notify(
    std::string_view summary,
    std::string_view body,
    const std::optional<std::string>& image,
    const std::optional<std::string>& sound) override;
};

struct CommandNotifierOptions final {
  // 调用方式：<notify_program> [-i <image>] <summary> <body>
  std::string notify_program{"notify-send"};

  // 调用方式：<sound_program> <sound>，后台运行，不等待其结束。
  std::string sound_program{"paplay"};
};

/**
 * @brief 通过外部程序呈现通知（默认 notify-send + paplay）。
 *
 * - 通知程序同步等待：退出码非 0、被信号终止或 exec 失败 -> errc::notify_failed
 * - 提示音由脱离的孙进程播放，播放失败不影响本次通知结果
 */
class CommandNotifier final : public Notifier {
 public:
  explicit CommandNotifier(CommandNotifierOptions options = {});

  std::error_code notify(
    std::string_view summary,
    std::string_view body,
    const std::optional<std::string>& image,
    const std::optional<std::string>& sound) override;

 private:
  CommandNotifierOptions options_{};
};

}  // namespace fmn::scheduler
