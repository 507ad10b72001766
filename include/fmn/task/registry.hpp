#pragma once

#include "fmn/task/task.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace fmn::task {

/**
 * @brief 供列表展示使用的任务登记表（内存、线程安全）。
 *
 * 与调度器内部的取消登记表相互独立：这里只记录“用户添加过且未删除”的任务。
 * 已触发完毕的一次性任务不会自动消失，由调用方用 prune_expired 清理。
 */
class TaskRegistry final {
 public:
  // 标识已存在时返回 false，不覆盖原记录。
  bool add(const Task& task);

  std::optional<Task> remove(const TaskId& id);

  [[nodiscard]] std::optional<Task> find(const TaskId& id) const;

  // 按创建时间升序。
  [[nodiscard]] std::vector<Task> list() const;

  [[nodiscard]] std::size_t size() const;

  // 移除触发时间不晚于 now 的 Once 任务，返回移除的数量。
  std::size_t prune_expired(core::time_point now);

 private:
  mutable std::mutex mu_{};
  std::map<TaskId, Task> tasks_{};
};

}  // namespace fmn::task
