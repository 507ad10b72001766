#include "fmn/task/registry.hpp"

#include <algorithm>
#include <variant>

namespace fmn::task {

bool TaskRegistry::add(const Task& task) {
  std::lock_guard lk(mu_);
  return tasks_.emplace(task.id, task).second;
}

std::optional<Task> TaskRegistry::remove(const TaskId& id) {
  std::lock_guard lk(mu_);
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  Task task = std::move(it->second);
  tasks_.erase(it);
  return task;
}

std::optional<Task> TaskRegistry::find(const TaskId& id) const {
  std::lock_guard lk(mu_);
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Task> TaskRegistry::list() const {
  std::vector<Task> out;
  {
    std::lock_guard lk(mu_);
    out.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
      out.push_back(task);
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const Task& a, const Task& b) { return a.created_at < b.created_at; });
  return out;
}

std::size_t TaskRegistry::size() const {
  std::lock_guard lk(mu_);
  return tasks_.size();
}

std::size_t TaskRegistry::prune_expired(core::time_point now) {
  std::lock_guard lk(mu_);
  std::size_t removed = 0;
  for (auto it = tasks_.begin(); it != tasks_.end();) {
    const auto* once = std::get_if<Once>(&it->second.clock);
    if (once && once->at <= now) {
      it = tasks_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

}  // namespace fmn::task
