#include "fmn/core/error.hpp"

#include "test_main.hpp"

#include <string_view>

namespace {

using fmn::core::errc;
using fmn::core::make_error_code;

void test_error_category_and_messages() {
  auto ec = make_error_code(errc::scheduler_unavailable);
  TEST_EXPECT(ec.category().name() != nullptr);
  TEST_EXPECT_EQ(std::string_view(ec.category().name()), "fmn.core");
  TEST_EXPECT(!ec.message().empty());
  TEST_EXPECT(static_cast<bool>(ec));

  TEST_EXPECT_EQ(make_error_code(errc::cancelled), make_error_code(errc::cancelled));
  TEST_EXPECT(make_error_code(errc::cancelled) != make_error_code(errc::timeout));
}

void test_all_error_codes() {
  TEST_EXPECT_EQ(make_error_code(errc::ok).message(), "ok");
  TEST_EXPECT_EQ(make_error_code(errc::timeout).message(), "timeout");
  TEST_EXPECT_EQ(make_error_code(errc::cancelled).message(), "cancelled");
  TEST_EXPECT_EQ(make_error_code(errc::invalid_argument).message(), "invalid argument");
  TEST_EXPECT_EQ(make_error_code(errc::invalid_duration).message(), "invalid duration");
  TEST_EXPECT_EQ(make_error_code(errc::invalid_time).message(), "invalid time");
  TEST_EXPECT_EQ(make_error_code(errc::scheduler_unavailable).message(), "scheduler unavailable");
  TEST_EXPECT_EQ(make_error_code(errc::no_receiver).message(), "no active receiver");
  TEST_EXPECT_EQ(make_error_code(errc::notify_failed).message(), "notification failed");
  TEST_EXPECT(!make_error_code(errc::wrong_thread).message().empty());
}

void test_unknown_error_code() {
  std::error_code ec(9999, fmn::core::error_category());
  TEST_EXPECT_EQ(ec.message(), "unknown fmn.core error");
}

void test_implicit_conversion_from_enum() {
  std::error_code ec = errc::invalid_time;
  TEST_EXPECT_EQ(ec, make_error_code(errc::invalid_time));
}

}  // namespace

int main() {
  test_error_category_and_messages();
  test_all_error_codes();
  test_unknown_error_code();
  test_implicit_conversion_from_enum();
  return ::fmn::tests::run_and_report();
}
