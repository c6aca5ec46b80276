#include "cborwire/cbor/error.hpp"

#include <string>

namespace cborwire::cbor {
namespace {

// cbor::errc 的 std::error_category 实现：message() 仅用于调试与日志。
class cbor_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "cborwire.cbor"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::unexpected_end:
        return "unexpected end of input";
      case errc::invalid_data:
        return "invalid cbor data";
      default:
        return "unknown cborwire.cbor error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static cbor_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace cborwire::cbor
