#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace cborwire::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// Writer 默认初始容量：典型记录一次分配即可容纳，超出后按 vector 策略扩容。
inline constexpr std::size_t kDefaultWriterCapacity = 256;

// skip 默认最大嵌套深度：防止恶意输入构造极深嵌套导致栈溢出。
inline constexpr std::size_t kDefaultMaxNestingDepth = 512;

}  // 命名空间 cborwire::core
