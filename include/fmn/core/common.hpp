#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace fmn::core {

// 调度器内部统一使用的时钟：
// - steady_clock：计时/等待（不受系统时间调整影响）
// - system_clock：绝对触发时刻（Once/每日任务的墙上时间）
using steady_clock = std::chrono::steady_clock;
using system_clock = std::chrono::system_clock;
using duration = steady_clock::duration;
using time_point = system_clock::time_point;

// 调度命令通道默认容量（背压上界：满时调用线程阻塞等待）。
inline constexpr std::size_t kDefaultCommandCapacity = 8;

// 每日任务的默认轮询间隔（用于察觉墙上时间跳变）。
inline constexpr duration kDefaultDailyPollInterval = std::chrono::seconds{60};

}  // 命名空间 fmn::core
