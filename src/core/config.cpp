#include "fmn/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace fmn::core {
namespace {

[[nodiscard]] std::optional<std::string> read_env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

}  // namespace

Environment load_environment() {
  Environment env{};
  env.image_path = read_env("FMN_IMAGE_PATH");
  env.sound_path = read_env("FMN_SOUND_PATH");

  if (auto level = read_env("FMN_LOG_LEVEL")) {
    env.log_level = parse_log_level(*level);
    if (!env.log_level) {
      spdlog::warn("ignore unknown FMN_LOG_LEVEL value: {}", *level);
    }
  }
  return env;
}

}  // namespace fmn::core
