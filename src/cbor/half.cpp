#include "cborwire/cbor/half.hpp"

#include <bit>

namespace cborwire::cbor {
namespace {

constexpr std::uint16_t kHalfInf = 0x7c00u;
constexpr std::uint32_t kSingleInf = 0x7f80'0000u;
constexpr std::uint32_t kSingleImplicitBit = 0x0080'0000u;

constexpr int kSingleBias = 127;
constexpr int kHalfBias = 15;

}  // namespace

std::uint16_t to_f16(float value) noexcept {
  const auto bits = std::bit_cast<std::uint32_t>(value);
  const auto sign = static_cast<std::uint16_t>((bits >> 16) & 0x8000u);
  const auto exp = static_cast<int>((bits >> 23) & 0xffu);
  const std::uint32_t frac = bits & 0x007f'ffffu;

  if (exp == 0xff) {
    if (frac == 0) {
      return static_cast<std::uint16_t>(sign | kHalfInf);
    }
    // 截断后的高位可能全为 0，强制置最低位以保留 NaN。
    return static_cast<std::uint16_t>(sign | kHalfInf | (frac >> 13) | 0x0001u);
  }

  const int unbiased = exp - kSingleBias;
  if (unbiased > kHalfBias) {
    return static_cast<std::uint16_t>(sign | kHalfInf);
  }
  if (unbiased < -24) {
    return sign;
  }
  if (unbiased < -14) {
    // 次正规数：m * 2^-24，m = (1.frac * 2^23) >> (-1 - unbiased)，移位量 14..23。
    const auto shift = static_cast<unsigned>(-1 - unbiased);
    const std::uint32_t mantissa = frac | kSingleImplicitBit;
    return static_cast<std::uint16_t>(sign | (mantissa >> shift));
  }

  const auto half_exp = static_cast<std::uint16_t>((unbiased + kHalfBias) << 10);
  const auto half_frac = static_cast<std::uint16_t>(frac >> 13);
  return static_cast<std::uint16_t>(sign | half_exp | half_frac);
}

float from_f16(std::uint16_t bits) noexcept {
  const std::uint32_t sign = static_cast<std::uint32_t>(bits & 0x8000u) << 16;
  const std::uint32_t exp = (bits >> 10) & 0x1fu;
  std::uint32_t frac = bits & 0x03ffu;

  if (exp == 0) {
    if (frac == 0) {
      return std::bit_cast<float>(sign);
    }
    // 次正规数：左移直到隐含位出现，再按移位次数修正指数。
    int shifts = 0;
    while ((frac & 0x0400u) == 0) {
      frac <<= 1;
      ++shifts;
    }
    frac &= 0x03ffu;
    const auto single_exp = static_cast<std::uint32_t>(kSingleBias - kHalfBias - shifts + 1) << 23;
    return std::bit_cast<float>(sign | single_exp | (frac << 13));
  }
  if (exp == 0x1f) {
    return std::bit_cast<float>(sign | kSingleInf | (frac << 13));
  }

  const std::uint32_t single_exp = (exp + static_cast<std::uint32_t>(kSingleBias - kHalfBias)) << 23;
  return std::bit_cast<float>(sign | single_exp | (frac << 13));
}

}  // namespace cborwire::cbor
