#pragma once

#include "cborwire/core/common.hpp"

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace cborwire::cbor {

using byte = cborwire::core::byte;
using bytes_view = cborwire::core::bytes_view;
using mutable_bytes_view = cborwire::core::mutable_bytes_view;

/**
 * @brief CBOR 头字节的 3-bit 主类型（RFC 8949 子集）。
 *
 * 头字节布局：
 * - 高 3 位：major_type
 * - 低 5 位：additional info（0..23 内联值；24..27 表示后续 1/2/4/8 字节；31 表示不定长）
 */
enum class major_type : std::uint8_t {
  unsigned_int = 0,
  negative_int = 1,
  byte_string = 2,
  text_string = 3,
  array = 4,
  map = 5,
  tag = 6,
  simple = 7,
};

inline constexpr std::uint8_t kAiMaxInline = 23;
inline constexpr std::uint8_t kAiOneByte = 24;
inline constexpr std::uint8_t kAiTwoBytes = 25;
inline constexpr std::uint8_t kAiFourBytes = 26;
inline constexpr std::uint8_t kAiEightBytes = 27;
inline constexpr std::uint8_t kAiIndefinite = 31;

inline constexpr byte kFalse = 0xf4;
inline constexpr byte kTrue = 0xf5;
inline constexpr byte kNull = 0xf6;
inline constexpr byte kHalfFloat = 0xf9;
inline constexpr byte kSingleFloat = 0xfa;
inline constexpr byte kDoubleFloat = 0xfb;
inline constexpr byte kBreak = 0xff;

constexpr byte make_header(major_type major, std::uint8_t ai) noexcept {
  return static_cast<byte>((static_cast<std::uint8_t>(major) << 5) | (ai & 0x1fu));
}

constexpr major_type major_of(byte header) noexcept {
  return static_cast<major_type>(header >> 5);
}

constexpr std::uint8_t additional_info_of(byte header) noexcept {
  return static_cast<std::uint8_t>(header & 0x1fu);
}

/**
 * @brief additional info 24..27 对应的参数字节数；其余返回 0。
 */
constexpr std::size_t argument_width(std::uint8_t ai) noexcept {
  switch (ai) {
    case kAiOneByte:
      return 1;
    case kAiTwoBytes:
      return 2;
    case kAiFourBytes:
      return 4;
    case kAiEightBytes:
      return 8;
    default:
      return 0;
  }
}

/**
 * @brief 定长整数（按类型位宽）使用的 additional info：1/2/4/8 字节 -> 24/25/26/27。
 */
template <class UInt>
constexpr std::uint8_t fixed_additional_info() noexcept {
  static_assert(std::is_unsigned_v<UInt>);
  if constexpr (sizeof(UInt) == 1) {
    return kAiOneByte;
  } else if constexpr (sizeof(UInt) == 2) {
    return kAiTwoBytes;
  } else if constexpr (sizeof(UInt) == 4) {
    return kAiFourBytes;
  } else {
    static_assert(sizeof(UInt) == 8);
    return kAiEightBytes;
  }
}

}  // namespace cborwire::cbor
