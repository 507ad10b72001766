#include "fmn/core/error.hpp"
#include "fmn/scheduler/scheduler.hpp"
#include "fmn/task/task.hpp"

#include "recording_notifier.hpp"
#include "test_main.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace {

using fmn::core::errc;
using fmn::core::make_error_code;
using fmn::scheduler::Notifier;
using fmn::scheduler::Scheduler;
using fmn::scheduler::SchedulerOptions;
using fmn::task::Once;
using fmn::task::OncePerDay;
using fmn::task::Period;
using fmn::task::Task;
using fmn::task::UtcOffset;
using fmn::tests::RecordingNotifier;
using fmn::tests::wait_for;

using namespace std::chrono;
using namespace std::chrono_literals;

[[nodiscard]] SchedulerOptions test_options() {
  SchedulerOptions opt{};
  opt.utc_offset = UtcOffset{};
  return opt;
}

void test_once_fires_once_with_description() {
  auto notifier = std::make_shared<RecordingNotifier>();
  Scheduler sched(notifier, test_options());
  TEST_EXPECT(sched.is_running());

  TEST_EXPECT_OK(sched.add_task(Task::create("test", Once{system_clock::now() + 300ms})));
  std::this_thread::sleep_for(600ms);
  TEST_EXPECT(notifier->bodies() == std::vector<std::string>{"test"});

  std::this_thread::sleep_for(300ms);
  TEST_EXPECT_EQ(notifier->calls(), std::size_t{1});
}

void test_once_in_the_past_never_fires() {
  auto notifier = std::make_shared<RecordingNotifier>();
  Scheduler sched(notifier, test_options());

  TEST_EXPECT_OK(sched.add_task(Task::create("late", Once{system_clock::now() - 5s})));
  std::this_thread::sleep_for(300ms);
  TEST_EXPECT_EQ(notifier->calls(), std::size_t{0});
}

void test_period_fires_until_cancelled() {
  auto notifier = std::make_shared<RecordingNotifier>();
  Scheduler sched(notifier, test_options());

  auto task = Task::create("tick", Period{200ms});
  TEST_EXPECT_OK(sched.add_task(task));
  std::this_thread::sleep_for(700ms);
  TEST_EXPECT_EQ(notifier->calls(), std::size_t{3});

  TEST_EXPECT_OK(sched.cancel_task(task));
  std::this_thread::sleep_for(400ms);
  TEST_EXPECT_EQ(notifier->calls(), std::size_t{3});
}

void test_cancel_only_affects_target() {
  auto notifier = std::make_shared<RecordingNotifier>();
  Scheduler sched(notifier, test_options());

  auto a = Task::create("A", Once{system_clock::now() + 300ms});
  auto b = Task::create("B", Once{system_clock::now() + 300ms});
  TEST_EXPECT_OK(sched.add_task(a));
  TEST_EXPECT_OK(sched.add_task(b));
  TEST_EXPECT_OK(sched.cancel_task(b.id));

  std::this_thread::sleep_for(600ms);
  TEST_EXPECT(notifier->bodies() == std::vector<std::string>{"A"});
}

void test_period_self_terminates_on_notify_failure() {
  auto notifier = std::make_shared<RecordingNotifier>(2);
  Scheduler sched(notifier, test_options());

  TEST_EXPECT_OK(sched.add_task(Task::create("fragile", Period{100ms})));
  std::this_thread::sleep_for(600ms);
  TEST_EXPECT_EQ(notifier->calls(), std::size_t{2});
}

void test_daily_fires_once_per_matching_minute() {
  auto notifier = std::make_shared<RecordingNotifier>();

  // 墙上时间从 10:29:59.7 开始走，目标 10:30；轮询间隔远小于一分钟。
  const auto start_at = sys_days{2024y / May / 1} + 10h + 29min + 59s + 700ms;
  const auto shift = system_clock::time_point{start_at} - system_clock::now();

  auto opt = test_options();
  opt.daily_poll_interval = 50ms;
  opt.wall_clock = [shift] { return system_clock::now() + shift; };
  Scheduler sched(notifier, opt);

  TEST_EXPECT_OK(sched.add_task(Task::create("standup", OncePerDay{10, 30})));
  TEST_EXPECT(wait_for([&] { return notifier->calls() >= 1; }, 2s));
  std::this_thread::sleep_for(500ms);
  TEST_EXPECT_EQ(notifier->calls(), std::size_t{1});
}

void test_concurrent_adds_are_independent() {
  auto notifier = std::make_shared<RecordingNotifier>();
  auto opt = test_options();
  // 小容量通道：并发调用方会经历背压阻塞，但不会丢命令。
  opt.command_capacity = 2;
  Scheduler sched(notifier, opt);

  constexpr int kThreads = 4;
  constexpr int kPerThread = 5;
  std::atomic<int> failures{0};
  std::vector<Task> cancelled(kThreads);

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      for (int j = 0; j < kPerThread; ++j) {
        auto task = Task::create("t" + std::to_string(i), Once{system_clock::now() + 300ms});
        if (j == 0) {
          cancelled[i] = task;
        }
        if (sched.add_task(task)) {
          ++failures;
        }
      }
      // 每个线程取消自己的第一个任务。
      if (sched.cancel_task(cancelled[i])) {
        ++failures;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  TEST_EXPECT_EQ(failures.load(), 0);
  const auto expected = static_cast<std::size_t>(kThreads * (kPerThread - 1));
  TEST_EXPECT(wait_for([&] { return notifier->calls() >= expected; }, 3s));
  std::this_thread::sleep_for(200ms);
  TEST_EXPECT_EQ(notifier->calls(), expected);
}

void test_cancel_unknown_task_succeeds() {
  auto notifier = std::make_shared<RecordingNotifier>();
  Scheduler sched(notifier, test_options());
  TEST_EXPECT_OK(sched.cancel_task(std::string("no-such-task")));
  TEST_EXPECT(sched.is_running());
}

void test_calls_fail_after_shutdown() {
  auto notifier = std::make_shared<RecordingNotifier>();
  Scheduler sched(notifier, test_options());

  auto pending = Task::create("pending", Period{50ms});
  TEST_EXPECT_OK(sched.add_task(pending));
  sched.shutdown();
  TEST_EXPECT(!sched.is_running());

  const auto unavailable = make_error_code(errc::scheduler_unavailable);
  TEST_EXPECT_EQ(sched.add_task(Task::create("late", Period{1s})), unavailable);
  TEST_EXPECT_EQ(sched.cancel_task(pending), unavailable);
  TEST_EXPECT_EQ(sched.cancel_task(pending.id), unavailable);

  // 已存活的周期任务随之停止。
  const auto calls = notifier->calls();
  std::this_thread::sleep_for(200ms);
  TEST_EXPECT_EQ(notifier->calls(), calls);

  // 重复 shutdown 无副作用。
  sched.shutdown();
}

// 在通知回调里（即调度线程上）调用门面：必须立即失败而不是死锁。
class ReentrantNotifier final : public Notifier {
 public:
  std::error_code notify(
    std::string_view,
    std::string_view,
    const std::optional<std::string>&,
    const std::optional<std::string>&) override {
    if (auto* sched = scheduler.load()) {
      result = sched->add_task(Task::create("nested", Period{1s}));
    }
    done = true;
    return {};
  }

  std::atomic<Scheduler*> scheduler{nullptr};
  std::error_code result{};
  std::atomic<bool> done{false};
};

void test_call_from_scheduler_thread_is_rejected() {
  auto notifier = std::make_shared<ReentrantNotifier>();
  Scheduler sched(notifier, test_options());
  notifier->scheduler = &sched;

  TEST_EXPECT_OK(sched.add_task(Task::create("outer", Once{system_clock::now() + 50ms})));
  TEST_EXPECT(wait_for([&] { return notifier->done.load(); }, 2s));
  TEST_EXPECT_EQ(notifier->result, make_error_code(errc::wrong_thread));
}

// 在通知回调中关闭调度器。
class ShutdownNotifier final : public Notifier {
 public:
  std::error_code notify(
    std::string_view,
    std::string_view,
    const std::optional<std::string>&,
    const std::optional<std::string>&) override {
    ++calls;
    if (auto* sched = scheduler.exchange(nullptr)) {
      sched->shutdown();
      was_running_after = sched->is_running();
    }
    return {};
  }

  std::atomic<Scheduler*> scheduler{nullptr};
  std::atomic<int> calls{0};
  std::atomic<bool> was_running_after{true};
};

void test_shutdown_from_scheduler_thread_closes_without_detach() {
  auto notifier = std::make_shared<ShutdownNotifier>();
  {
    Scheduler sched(notifier, test_options());
    notifier->scheduler = &sched;

    TEST_EXPECT_OK(sched.add_task(Task::create("tick", Period{50ms})));
    TEST_EXPECT(wait_for([&] { return notifier->calls.load() >= 1; }, 2s));
    TEST_EXPECT(wait_for([&] { return !sched.is_running(); }, 2s));
    TEST_EXPECT(!notifier->was_running_after.load());
    TEST_EXPECT_EQ(sched.add_task(Task::create("late", Period{1s})), make_error_code(errc::scheduler_unavailable));

    // 周期任务随通道关闭一起停止。
    std::this_thread::sleep_for(200ms);
    TEST_EXPECT_EQ(notifier->calls.load(), 1);

    // 拥有者线程再次 shutdown：回收后台线程。
    sched.shutdown();
  }
  TEST_EXPECT_EQ(notifier->calls.load(), 1);
}

}  // namespace

int main() {
  test_once_fires_once_with_description();
  test_once_in_the_past_never_fires();
  test_period_fires_until_cancelled();
  test_cancel_only_affects_target();
  test_period_self_terminates_on_notify_failure();
  test_daily_fires_once_per_matching_minute();
  test_concurrent_adds_are_independent();
  test_cancel_unknown_task_succeeds();
  test_calls_fail_after_shutdown();
  test_call_from_scheduler_thread_is_rejected();
  test_shutdown_from_scheduler_thread_closes_without_detach();
  return ::fmn::tests::run_and_report();
}
