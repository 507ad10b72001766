#pragma once

#include "fmn/core/log.hpp"

#include <optional>
#include <string>

namespace fmn::core {

/**
 * @brief 进程环境中读取的配置。
 *
 * - FMN_IMAGE_PATH：新任务默认附带的图片（任务自身未指定时使用）
 * - FMN_SOUND_PATH：新任务默认附带的提示音
 * - FMN_LOG_LEVEL：日志级别名（见 parse_log_level）
 *
 * 未设置或为空字符串的变量保持 nullopt。
 */
struct Environment final {
  std::optional<std::string> image_path{};
  std::optional<std::string> sound_path{};
  std::optional<LogLevel> log_level{};
};

[[nodiscard]] Environment load_environment();

}  // namespace fmn::core
