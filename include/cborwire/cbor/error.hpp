#pragma once

#include <system_error>

namespace cborwire::cbor {

/**
 * @brief 解码错误码。
 *
 * 只有两类失败：
 * - unexpected_end：读取会越过输入末尾（截断）
 * - invalid_data：字节存在但头部/主类型/编码不符合预期（含非法 UTF-8）
 *
 * 详细诊断文本由 Reader::error_message() 提供。
 */
enum class errc : int {
  ok = 0,
  unexpected_end = 1,
  invalid_data = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace cborwire::cbor

namespace std {
template <>
struct is_error_code_enum<cborwire::cbor::errc> : true_type {};
}  // namespace std
