#pragma once

#include <cstdint>

namespace cborwire::cbor {

/**
 * @brief IEEE-754 binary32 -> binary16（半精度）位模式。
 *
 * 规则：
 * - Inf 保留符号；NaN 保证结果尾数非零（NaN 属性不丢失）
 * - 超出半精度范围 -> 带符号无穷大；低于最小次正规数 -> 带符号零
 * - 尾数截断（向零舍入），非精确可表示的值会损失精度
 */
[[nodiscard]] std::uint16_t to_f16(float value) noexcept;

/**
 * @brief IEEE-754 binary16 位模式 -> binary32。对所有 65536 个输入都有定义。
 */
[[nodiscard]] float from_f16(std::uint16_t bits) noexcept;

}  // namespace cborwire::cbor
