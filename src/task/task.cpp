#include "fmn/task/task.hpp"

#include "fmn/core/error.hpp"

#include <string_view>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <random>
#include <type_traits>
#include <utility>

namespace fmn::task {
namespace {

using core::errc;
using core::make_error_code;

constexpr std::string_view kIdAlphabet =
  "_-0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr std::size_t kIdLength = 21;

}  // namespace

TaskId generate_task_id() {
  // 标识可能在任意调用线程上生成：随机引擎用互斥量保护。
  static std::mutex mu;
  static std::mt19937_64 engine{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> pick(0, kIdAlphabet.size() - 1);

  TaskId id(kIdLength, '\0');
  std::lock_guard lk(mu);
  for (auto& c : id) {
    c = kIdAlphabet[pick(engine)];
  }
  return id;
}

Task Task::create(
  std::string description,
  ClockType clock,
  std::optional<std::string> image_path,
  std::optional<std::string> sound_path) {
  Task task{};
  task.id = generate_task_id();
  task.description = std::move(description);
  task.clock = std::move(clock);
  task.created_at = core::system_clock::now();
  task.image_path = std::move(image_path);
  task.sound_path = std::move(sound_path);
  return task;
}

std::error_code validate_clock(const ClockType& clock) noexcept {
  return std::visit(
    [](const auto& c) -> std::error_code {
      using T = std::decay_t<decltype(c)>;
      if constexpr (std::is_same_v<T, Period>) {
        if (c.every <= core::duration::zero()) {
          return make_error_code(errc::invalid_duration);
        }
      } else if constexpr (std::is_same_v<T, OncePerDay>) {
        if (c.hour > 23 || c.minute > 59) {
          return make_error_code(errc::invalid_time);
        }
      }
      return {};
    },
    clock);
}

std::string to_string(const ClockType& clock, UtcOffset offset) {
  return std::visit(
    [&](const auto& c) -> std::string {
      using T = std::decay_t<decltype(c)>;
      if constexpr (std::is_same_v<T, Once>) {
        return "at " + format_local(c.at, offset);
      } else if constexpr (std::is_same_v<T, Period>) {
        const auto secs = std::chrono::duration_cast<std::chrono::seconds>(c.every).count();
        return "every " + std::to_string(secs) + " secs";
      } else {
        char buf[32];
        std::snprintf(
          buf, sizeof(buf), "at %02u:%02u every day", static_cast<unsigned>(c.hour), static_cast<unsigned>(c.minute));
        return std::string(buf);
      }
    },
    clock);
}

}  // namespace fmn::task
