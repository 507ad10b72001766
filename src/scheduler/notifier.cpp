#include "fmn/scheduler/notifier.hpp"

#include "fmn/core/error.hpp"

#include <spdlog/spdlog.h>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

namespace fmn::scheduler {
namespace {

using core::errc;
using core::make_error_code;

// argv 在 fork 之前准备好：子进程里只做 exec/_exit。
class Argv final {
 public:
  explicit Argv(std::vector<std::string> args) : args_(std::move(args)) {
    ptrs_.reserve(args_.size() + 1);
    for (auto& a : args_) {
      ptrs_.push_back(a.data());
    }
    ptrs_.push_back(nullptr);
  }

  [[nodiscard]] char* const* data() noexcept { return ptrs_.data(); }
  [[nodiscard]] const char* program() const noexcept { return args_.front().c_str(); }

 private:
  std::vector<std::string> args_;
  std::vector<char*> ptrs_;
};

[[nodiscard]] int wait_child(pid_t pid) noexcept {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return status;
}

// 同步运行并等待退出；只有正常退出且退出码为 0 才算成功。
[[nodiscard]] std::error_code run_and_wait(Argv& argv) {
  const pid_t pid = ::fork();
  if (pid < 0) {
    return std::error_code(errno, std::generic_category());
  }
  if (pid == 0) {
    ::execvp(argv.program(), argv.data());
    ::_exit(127);
  }

  const int status = wait_child(pid);
  if (status < 0) {
    return std::error_code(errno, std::generic_category());
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    return {};
  }
  if (WIFEXITED(status)) {
    spdlog::error("{} exited with status {}", argv.program(), WEXITSTATUS(status));
  } else if (WIFSIGNALED(status)) {
    spdlog::error("{} killed by signal {}", argv.program(), WTERMSIG(status));
  }
  return make_error_code(errc::notify_failed);
}

// 双重 fork：中间进程立即退出，播放器成为孤儿进程，不留僵尸也无需等待。
void spawn_detached(Argv& argv) {
  const pid_t pid = ::fork();
  if (pid < 0) {
    spdlog::error("fail to fork sound player: {}", std::strerror(errno));
    return;
  }
  if (pid == 0) {
    const pid_t grandchild = ::fork();
    if (grandchild == 0) {
      (void)::setsid();
      ::execvp(argv.program(), argv.data());
      ::_exit(127);
    }
    ::_exit(grandchild < 0 ? 1 : 0);
  }
  if (wait_child(pid) < 0) {
    spdlog::error("fail to reap sound player launcher: {}", std::strerror(errno));
  }
}

}  // namespace

std::error_code LogNotifier::notify(
  std::string_view summary,
  std::string_view body,
  const std::optional<std::string>& image,
  const std::optional<std::string>& sound) {
  spdlog::info(
    "[{}] {} (image: {}, sound: {})",
    summary,
    body,
    image.value_or("-"),
    sound.value_or("-"));
  return {};
}

CommandNotifier::CommandNotifier(CommandNotifierOptions options) : options_(std::move(options)) {}

std::error_code CommandNotifier::notify(
  std::string_view summary,
  std::string_view body,
  const std::optional<std::string>& image,
  const std::optional<std::string>& sound) {
  if (options_.notify_program.empty()) {
    return make_error_code(errc::invalid_argument);
  }

  std::vector<std::string> args{options_.notify_program};
  if (image.has_value()) {
    args.emplace_back("-i");
    args.push_back(*image);
  }
  args.emplace_back(summary);
  args.emplace_back(body);

  Argv argv(std::move(args));
  auto ec = run_and_wait(argv);
  if (ec) {
    spdlog::error("fail to run {}: {}", options_.notify_program, ec.message());
    return make_error_code(errc::notify_failed);
  }

  if (sound.has_value() && !options_.sound_program.empty()) {
    Argv player({options_.sound_program, *sound});
    spawn_detached(player);
  }
  return {};
}

}  // namespace fmn::scheduler
