#include "cborwire/cbor/writer.hpp"

#include "cborwire/cbor/half.hpp"

#include <bit>
#include <utility>

namespace cborwire::cbor {

/*
 * Writer 的实现模型：
 * - buf_ 只追加，不回退；finish() 把整个 vector 移交给调用方。
 * - 头字节 = major_type << 5 | additional info；多字节参数一律大端。
 * - 定长整数的 additional info 由“类型位宽”决定，最小长度编码由“数值大小”决定，
 *   两者互不替代（读端同样按调用的方法区分）。
 */
Writer::Writer(std::size_t initial_capacity) { buf_.reserve(initial_capacity); }

std::size_t Writer::size() const noexcept { return buf_.size(); }

bool Writer::empty() const noexcept { return buf_.empty(); }

bytes_view Writer::view() const noexcept {
    return bytes_view{buf_.data(), buf_.size()};
}

void Writer::reset() noexcept { buf_.clear(); }

std::vector<byte> Writer::finish() && noexcept { return std::move(buf_); }

template <class UInt>
void Writer::write_be_uint(UInt v) {
    for (std::size_t i = 0; i < sizeof(UInt); ++i) {
        const auto shift = static_cast<unsigned>(8u * (sizeof(UInt) - 1u - i));
        buf_.push_back(static_cast<byte>((v >> shift) & 0xFFu));
    }
}

template <class UInt>
void Writer::write_fixed_unsigned(UInt v) {
    buf_.push_back(make_header(major_type::unsigned_int, fixed_additional_info<UInt>()));
    write_be_uint<UInt>(v);
}

template <class SInt, class UInt>
void Writer::write_fixed_signed(SInt v) {
    static_assert(sizeof(SInt) == sizeof(UInt));
    if (v >= 0) {
        buf_.push_back(make_header(major_type::unsigned_int, fixed_additional_info<UInt>()));
        write_be_uint<UInt>(static_cast<UInt>(v));
        return;
    }
    // 负数按 -1 - v 编码；对无符号按位取反等价且不会溢出。
    buf_.push_back(make_header(major_type::negative_int, fixed_additional_info<UInt>()));
    write_be_uint<UInt>(static_cast<UInt>(~static_cast<UInt>(v)));
}

void Writer::write_header_and_argument(major_type major, std::uint64_t n) {
    if (n <= kAiMaxInline) {
        buf_.push_back(make_header(major, static_cast<std::uint8_t>(n)));
    } else if (n <= 0xFFu) {
        buf_.push_back(make_header(major, kAiOneByte));
        write_be_uint<std::uint8_t>(static_cast<std::uint8_t>(n));
    } else if (n <= 0xFFFFu) {
        buf_.push_back(make_header(major, kAiTwoBytes));
        write_be_uint<std::uint16_t>(static_cast<std::uint16_t>(n));
    } else if (n <= 0xFFFF'FFFFu) {
        buf_.push_back(make_header(major, kAiFourBytes));
        write_be_uint<std::uint32_t>(static_cast<std::uint32_t>(n));
    } else {
        buf_.push_back(make_header(major, kAiEightBytes));
        write_be_uint<std::uint64_t>(n);
    }
}

void Writer::write_bool(bool v) { buf_.push_back(v ? kTrue : kFalse); }

void Writer::write_null() { buf_.push_back(kNull); }

void Writer::write_u8(std::uint8_t v) { write_fixed_unsigned<std::uint8_t>(v); }

void Writer::write_u16(std::uint16_t v) { write_fixed_unsigned<std::uint16_t>(v); }

void Writer::write_u32(std::uint32_t v) { write_fixed_unsigned<std::uint32_t>(v); }

void Writer::write_u64(std::uint64_t v) { write_fixed_unsigned<std::uint64_t>(v); }

void Writer::write_i8(std::int8_t v) { write_fixed_signed<std::int8_t, std::uint8_t>(v); }

void Writer::write_i16(std::int16_t v) { write_fixed_signed<std::int16_t, std::uint16_t>(v); }

void Writer::write_i32(std::int32_t v) { write_fixed_signed<std::int32_t, std::uint32_t>(v); }

void Writer::write_i64(std::int64_t v) { write_fixed_signed<std::int64_t, std::uint64_t>(v); }

void Writer::write_uvarint(std::uint64_t v) {
    write_header_and_argument(major_type::unsigned_int, v);
}

void Writer::write_ivarint(std::int64_t v) {
    if (v >= 0) {
        write_header_and_argument(major_type::unsigned_int, static_cast<std::uint64_t>(v));
        return;
    }
    write_header_and_argument(major_type::negative_int, ~static_cast<std::uint64_t>(v));
}

void Writer::write_f16(float v) {
    buf_.push_back(kHalfFloat);
    write_be_uint<std::uint16_t>(to_f16(v));
}

void Writer::write_f32(float v) {
    buf_.push_back(kSingleFloat);
    write_be_uint<std::uint32_t>(std::bit_cast<std::uint32_t>(v));
}

void Writer::write_f64(double v) {
    buf_.push_back(kDoubleFloat);
    write_be_uint<std::uint64_t>(std::bit_cast<std::uint64_t>(v));
}

void Writer::write_string(std::string_view v) {
    write_header_and_argument(major_type::text_string, v.size());
    buf_.insert(buf_.end(),
                reinterpret_cast<const byte *>(v.data()),
                reinterpret_cast<const byte *>(v.data()) + v.size());
}

void Writer::write_bytes(bytes_view v) {
    write_header_and_argument(major_type::byte_string, v.size());
    buf_.insert(buf_.end(), v.begin(), v.end());
}

void Writer::write_array_header(std::uint64_t count) {
    write_header_and_argument(major_type::array, count);
}

void Writer::write_tag_header(std::uint64_t tag) {
    write_header_and_argument(major_type::tag, tag);
}

void Writer::write_byte(byte b) { buf_.push_back(b); }

void Writer::write_raw(bytes_view v) { buf_.insert(buf_.end(), v.begin(), v.end()); }

} // namespace cborwire::cbor
