#include "cborwire/cbor/error.hpp"

#include "test_main.hpp"

#include <string_view>

namespace {

using cborwire::cbor::errc;
using cborwire::cbor::make_error_code;

void test_error_category_and_messages() {
  auto ec = make_error_code(errc::invalid_data);
  TEST_EXPECT(ec.category().name() != nullptr);
  TEST_EXPECT_EQ(std::string_view(ec.category().name()), "cborwire.cbor");
  TEST_EXPECT(!ec.message().empty());

  TEST_EXPECT_EQ(make_error_code(errc::unexpected_end), make_error_code(errc::unexpected_end));
  TEST_EXPECT(make_error_code(errc::unexpected_end) != make_error_code(errc::invalid_data));
}

void test_all_error_codes() {
  auto ok = make_error_code(errc::ok);
  TEST_EXPECT_EQ(ok.message(), "ok");
  TEST_EXPECT(!ok);

  auto end = make_error_code(errc::unexpected_end);
  TEST_EXPECT_EQ(end.message(), "unexpected end of input");
  TEST_EXPECT(static_cast<bool>(end));

  auto invalid = make_error_code(errc::invalid_data);
  TEST_EXPECT_EQ(invalid.message(), "invalid cbor data");
  TEST_EXPECT(static_cast<bool>(invalid));
}

void test_implicit_conversion_from_enum() {
  std::error_code ec = errc::invalid_data;
  TEST_EXPECT_EQ(ec, make_error_code(errc::invalid_data));
  TEST_EXPECT(&ec.category() == &cborwire::cbor::error_category());
}

void test_unknown_error_code() {
  std::error_code ec(9999, cborwire::cbor::error_category());
  TEST_EXPECT_EQ(ec.message(), "unknown cborwire.cbor error");
}

}  // namespace

int main() {
  test_error_category_and_messages();
  test_all_error_codes();
  test_implicit_conversion_from_enum();
  test_unknown_error_code();
  return ::cborwire::tests::run_and_report();
}
