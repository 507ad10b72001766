#pragma once

#include <system_error>

namespace fmn::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 对外接口优先返回 std::error_code，避免异常路径。
 * - scheduler_unavailable 是唯一会穿过 Scheduler 门面返回给调用方的运行期错误；
 *   其余（取消未知任务、通知失败等）只在内部记录日志并影响对应任务的生命周期。
 */
enum class errc : int {
  ok = 0,
  timeout = 1,
  cancelled = 2,
  invalid_argument = 3,
  invalid_duration = 4,
  invalid_time = 5,
  scheduler_unavailable = 6,
  wrong_thread = 7,
  no_receiver = 8,
  notify_failed = 9,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace fmn::core

namespace std {
template <>
struct is_error_code_enum<fmn::core::errc> : true_type {};
}  // namespace std
