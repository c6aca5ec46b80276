#pragma once

#include "cborwire/cbor/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace cborwire::cbor {

/**
 * @brief 只追加的 CBOR 编码器（独占内部缓冲区）。
 *
 * 两种整数编码约定：
 * - 定长：write_u8..write_u64 / write_i8..write_i64 总是输出类型位宽对应的
 *   头部（ai 24/25/26/27）与完整 payload，与数值大小无关；
 * - 最小长度：write_uvarint / write_ivarint 以及字符串/数组/tag 的长度字段，
 *   选择能表示该值的最短编码。
 *
 * 所有写操作都不会失败（仅追加）。通过 std::move(w).finish() 取出结果字节。
 *
 * 注意：
 * - 本类不做线程安全保证。
 */
class Writer final {
public:
    explicit Writer(std::size_t initial_capacity = cborwire::core::kDefaultWriterCapacity);

    Writer(Writer &&other) noexcept = default;
    Writer &operator=(Writer &&other) noexcept = default;

    Writer(const Writer &) = delete;
    Writer &operator=(const Writer &) = delete;

    ~Writer() = default;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] bytes_view view() const noexcept;

    // 丢弃已写入内容但保留容量，便于复用同一个 Writer 编码多条消息。
    void reset() noexcept;

    [[nodiscard]] std::vector<byte> finish() && noexcept;

    void write_bool(bool v);
    void write_null();

    void write_u8(std::uint8_t v);
    void write_u16(std::uint16_t v);
    void write_u32(std::uint32_t v);
    void write_u64(std::uint64_t v);

    void write_i8(std::int8_t v);
    void write_i16(std::int16_t v);
    void write_i32(std::int32_t v);
    void write_i64(std::int64_t v);

    void write_uvarint(std::uint64_t v);
    void write_ivarint(std::int64_t v);

    // 半精度：经 to_f16 转换，超范围饱和、尾数截断。
    void write_f16(float v);
    void write_f32(float v);
    void write_f64(double v);

    void write_string(std::string_view v);
    void write_bytes(bytes_view v);

    void write_array_header(std::uint64_t count);
    void write_tag_header(std::uint64_t tag);

    // 原样写出：用于 Writer 没有专门方法的字节（或预先编码好的数据项）。
    void write_byte(byte b);
    void write_raw(bytes_view v);

private:
    void write_header_and_argument(major_type major, std::uint64_t n);

    template <class UInt>
    void write_be_uint(UInt v);

    template <class UInt>
    void write_fixed_unsigned(UInt v);

    template <class SInt, class UInt>
    void write_fixed_signed(SInt v);

    std::vector<byte> buf_;
};

} // namespace cborwire::cbor
