#include "fmn/task/time.hpp"

#include "fmn/core/error.hpp"

#include <charconv>
#include <cstdio>
#include <ctime>
#include <iterator>

namespace fmn::task {
namespace {

using core::errc;
using core::make_error_code;

using days = std::chrono::days;

// 从 text[pos] 开始读取一段十进制数字；没有数字时返回 false。
[[nodiscard]] bool read_number(std::string_view text, std::size_t& pos, std::uint64_t& out) noexcept {
  const char* first = text.data() + pos;
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc{} || ptr == first) {
    return false;
  }
  pos += static_cast<std::size_t>(ptr - first);
  return true;
}

struct Unit final {
  char suffix;
  std::uint64_t seconds;
};

constexpr Unit kUnits[] = {
  {'d', 24ULL * 3600ULL},
  {'h', 3600ULL},
  {'m', 60ULL},
  {'s', 1ULL},
};

}  // namespace

UtcOffset current_local_offset() noexcept {
  const std::time_t now = std::time(nullptr);
  std::tm local{};
  if (::localtime_r(&now, &local) == nullptr) {
    return UtcOffset{};
  }
  return UtcOffset{std::chrono::minutes{local.tm_gmtoff / 60}};
}

HourMinute local_hour_minute(core::time_point t, UtcOffset offset) noexcept {
  const auto local = t + offset.value;
  const auto since_midnight = local - std::chrono::floor<days>(local);
  const auto hours = std::chrono::floor<std::chrono::hours>(since_midnight);
  const auto minutes = std::chrono::floor<std::chrono::minutes>(since_midnight - hours);
  return HourMinute{static_cast<std::uint8_t>(hours.count()), static_cast<std::uint8_t>(minutes.count())};
}

core::time_point next_daily_occurrence(
  core::time_point now,
  std::uint8_t hour,
  std::uint8_t minute,
  UtcOffset offset) noexcept {
  const auto local = now + offset.value;
  core::time_point candidate =
    std::chrono::floor<days>(local) + std::chrono::hours{hour} + std::chrono::minutes{minute};
  if (candidate <= local) {
    candidate += days{1};
  }
  return candidate - offset.value;
}

std::string format_local(core::time_point t, UtcOffset offset) {
  const auto local = t + offset.value;
  const auto day = std::chrono::floor<days>(local);
  const std::chrono::year_month_day ymd{day};
  const auto hm = local_hour_minute(t, offset);

  char buf[32];
  std::snprintf(
    buf,
    sizeof(buf),
    "%04d-%02u-%02u %02u:%02u",
    static_cast<int>(ymd.year()),
    static_cast<unsigned>(ymd.month()),
    static_cast<unsigned>(ymd.day()),
    static_cast<unsigned>(hm.hour),
    static_cast<unsigned>(hm.minute));
  return std::string(buf);
}

std::error_code parse_duration(std::string_view text, std::chrono::seconds& out) noexcept {
  std::uint64_t total = 0;
  std::size_t pos = 0;
  std::size_t next_unit = 0;

  while (pos < text.size()) {
    std::uint64_t value = 0;
    if (!read_number(text, pos, value) || pos >= text.size()) {
      return make_error_code(errc::invalid_duration);
    }

    // 单位必须按 d/h/m/s 顺序出现且不重复。
    const char suffix = text[pos++];
    std::size_t idx = next_unit;
    while (idx < std::size(kUnits) && kUnits[idx].suffix != suffix) {
      ++idx;
    }
    if (idx == std::size(kUnits)) {
      return make_error_code(errc::invalid_duration);
    }
    next_unit = idx + 1;

    const auto unit = kUnits[idx].seconds;
    constexpr auto kMax = static_cast<std::uint64_t>(kMaxDuration.count());
    if (value > (kMax - total) / unit) {
      return make_error_code(errc::invalid_duration);
    }
    total += value * unit;
  }

  out = std::chrono::seconds{static_cast<std::int64_t>(total)};
  return {};
}

std::error_code parse_hour_minute(std::string_view text, HourMinute& out) noexcept {
  std::size_t pos = 0;
  std::uint64_t hour = 0;
  std::uint64_t minute = 0;

  if (!read_number(text, pos, hour) || pos >= text.size() || text[pos] != ':') {
    return make_error_code(errc::invalid_time);
  }
  ++pos;
  if (!read_number(text, pos, minute)) {
    return make_error_code(errc::invalid_time);
  }
  if (pos < text.size()) {
    std::uint64_t second = 0;
    if (text[pos] != ':') {
      return make_error_code(errc::invalid_time);
    }
    ++pos;
    if (!read_number(text, pos, second) || pos != text.size() || second > 59) {
      return make_error_code(errc::invalid_time);
    }
  }
  if (hour > 23 || minute > 59) {
    return make_error_code(errc::invalid_time);
  }

  out = HourMinute{static_cast<std::uint8_t>(hour), static_cast<std::uint8_t>(minute)};
  return {};
}

std::error_code parse_at(
  std::string_view text,
  core::time_point now,
  UtcOffset offset,
  core::time_point& out) noexcept {
  HourMinute hm{};
  if (auto ec = parse_hour_minute(text, hm)) {
    return ec;
  }
  out = next_daily_occurrence(now, hm.hour, hm.minute, offset);
  return {};
}

}  // namespace fmn::task
