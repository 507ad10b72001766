/**
 * @file fmn_repl.cpp
 * @brief 交互式提醒示例：从标准输入读取命令，交给调度器执行
 *
 * 用法: ./fmn_repl [--log-only]
 *
 * 命令:
 *   after <duration> <text>        例: after 25m tea
 *   per <duration> <text>          例: per 1h stretch
 *   at <HH:MM> [daily] <text>      例: at 12:30 daily lunch
 *   rm <task_id>
 *   list
 *   quit
 *
 * 环境变量: FMN_IMAGE_PATH / FMN_SOUND_PATH / FMN_LOG_LEVEL
 */

#include <fmn/core/config.hpp>
#include <fmn/core/error.hpp>
#include <fmn/core/log.hpp>
#include <fmn/scheduler/notifier.hpp>
#include <fmn/scheduler/scheduler.hpp>
#include <fmn/task/registry.hpp>
#include <fmn/task/task.hpp>
#include <fmn/task/time.hpp>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

using namespace fmn;

namespace {

void print_help() {
    std::cout << "commands:\n"
              << "  after <duration> <text>      e.g. after 25m tea\n"
              << "  per <duration> <text>        e.g. per 1h stretch\n"
              << "  at <HH:MM> [daily] <text>    e.g. at 12:30 daily lunch\n"
              << "  rm <task_id>\n"
              << "  list\n"
              << "  quit\n";
}

// 读取行内剩余部分作为描述（去掉前导空白）。
[[nodiscard]] std::string rest_of(std::istringstream &in) {
    std::string rest;
    std::getline(in >> std::ws, rest);
    return rest;
}

void print_tasks(task::TaskRegistry &registry, task::UtcOffset offset) {
    // 已送达的一次性提醒不再列出。
    registry.prune_expired(std::chrono::system_clock::now());
    std::cout << std::left << std::setw(23) << "ID" << std::setw(28) << "TYPE"
              << "DESCRIPTION\n";
    for (const auto &t : registry.list()) {
        std::cout << std::left << std::setw(23) << t.id << std::setw(28)
                  << task::to_string(t.clock, offset) << t.description << "\n";
    }
}

class Repl final {
public:
    Repl(scheduler::Scheduler &sched, core::Environment env)
        : sched_(sched), env_(std::move(env)) {}

    // 返回 false 表示退出。
    bool execute(const std::string &line) {
        std::istringstream in(line);
        std::string cmd;
        if (!(in >> cmd)) {
            return true;
        }

        if (cmd == "quit" || cmd == "exit") {
            return false;
        }
        if (cmd == "help") {
            print_help();
        } else if (cmd == "list") {
            print_tasks(registry_, sched_.utc_offset());
        } else if (cmd == "rm") {
            std::string id;
            in >> id;
            remove(id);
        } else if (cmd == "after" || cmd == "per") {
            std::string dur;
            in >> dur;
            add_with_duration(cmd == "per", dur, rest_of(in));
        } else if (cmd == "at") {
            add_at(in);
        } else {
            std::cout << "unknown command: " << cmd << " (try help)\n";
        }
        return true;
    }

private:
    void add_with_duration(bool periodic, std::string_view text, std::string description) {
        std::chrono::seconds secs{};
        if (auto ec = task::parse_duration(text, secs)) {
            std::cout << "fail: " << ec.message()
                      << "; valid examples: 1d1h1m1s, 2h, 30s, 55m\n";
            return;
        }
        if (secs.count() == 0) {
            std::cout << "fail: duration should not be 0\n";
            return;
        }

        task::ClockType clock = task::Period{secs};
        if (!periodic) {
            clock = task::Once{std::chrono::system_clock::now() + secs};
        }
        submit(std::move(description), std::move(clock));
    }

    void add_at(std::istringstream &in) {
        std::string time_text;
        in >> time_text;

        bool daily = false;
        std::string description = rest_of(in);
        constexpr std::string_view kDaily = "daily";
        if (description.rfind(kDaily, 0) == 0 &&
            (description.size() == kDaily.size() || description[kDaily.size()] == ' ')) {
            daily = true;
            description = description.substr(std::min(description.size(), kDaily.size() + 1));
        }

        task::HourMinute hm{};
        if (auto ec = task::parse_hour_minute(time_text, hm)) {
            std::cout << "fail: " << ec.message() << "; valid examples: 13:11, 07:05\n";
            return;
        }

        if (daily) {
            submit(std::move(description), task::OncePerDay{hm.hour, hm.minute});
            return;
        }
        core::time_point at{};
        if (auto ec = task::parse_at(time_text,
                                     std::chrono::system_clock::now(),
                                     sched_.utc_offset(),
                                     at)) {
            std::cout << "fail: " << ec.message() << "\n";
            return;
        }
        submit(std::move(description), task::Once{at});
    }

    void submit(std::string description, task::ClockType clock) {
        if (auto ec = task::validate_clock(clock)) {
            std::cout << "fail: " << ec.message() << "\n";
            return;
        }
        auto t = task::Task::create(std::move(description), std::move(clock),
                                    env_.image_path, env_.sound_path);
        const auto id = t.id;
        registry_.add(t);
        if (auto ec = sched_.add_task(std::move(t))) {
            (void)registry_.remove(id);
            std::cout << "fail: " << ec.message() << "\n";
            return;
        }
        std::cout << "added " << id << "\n";
    }

    void remove(const std::string &id) {
        auto removed = registry_.remove(id);
        if (!removed) {
            std::cout << "fail: no such task: " << id << "\n";
            return;
        }
        if (auto ec = sched_.cancel_task(*removed)) {
            std::cout << "fail: " << ec.message() << "\n";
            return;
        }
        std::cout << "removed " << id << "\n";
    }

    scheduler::Scheduler &sched_;
    core::Environment env_;
    task::TaskRegistry registry_{};
};

} // namespace

int main(int argc, char **argv) {
    auto env = core::load_environment();
    core::init_logging(env.log_level);

    std::shared_ptr<scheduler::Notifier> notifier;
    if (argc > 1 && std::string_view(argv[1]) == "--log-only") {
        notifier = std::make_shared<scheduler::LogNotifier>();
    } else {
        notifier = std::make_shared<scheduler::CommandNotifier>();
    }

    scheduler::Scheduler sched(notifier);
    Repl repl(sched, std::move(env));

    print_help();
    std::string line;
    while (std::cout << "fmn> " << std::flush, std::getline(std::cin, line)) {
        if (!repl.execute(line)) {
            break;
        }
        if (!sched.is_running()) {
            std::cerr << "scheduler is no longer running, exit\n";
            return 1;
        }
    }

    sched.shutdown();
    return 0;
}
