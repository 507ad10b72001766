#include "fmn/core/error.hpp"

#include <string>

namespace fmn::core {
namespace {

// core::errc 的 std::error_category 实现：
// - name() 用于区分错误域
// - message() 返回可读的英文描述（用于日志与命令行输出）
class fmn_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "fmn.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::timeout:
        return "timeout";
      case errc::cancelled:
        return "cancelled";
      case errc::invalid_argument:
        return "invalid argument";
      case errc::invalid_duration:
        return "invalid duration";
      case errc::invalid_time:
        return "invalid time";
      case errc::scheduler_unavailable:
        return "scheduler unavailable";
      case errc::wrong_thread:
        return "wrong thread (blocking API called from scheduler thread)";
      case errc::no_receiver:
        return "no active receiver";
      case errc::notify_failed:
        return "notification failed";
      default:
        return "unknown fmn.core error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static fmn_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // 命名空间 fmn::core
