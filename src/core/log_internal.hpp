#pragma once

#include <cstddef>
#include <string_view>
#include <system_error>

namespace cborwire::core::detail {

// 记录一次解码失败（debug 级别）；未开启 debug 时不做任何格式化。
void log_decode_failure(std::size_t offset,
                        const std::error_code &ec,
                        std::string_view message) noexcept;

} // namespace cborwire::core::detail
