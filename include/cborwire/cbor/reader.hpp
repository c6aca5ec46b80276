#pragma once

#include "cborwire/cbor/error.hpp"
#include "cborwire/cbor/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cborwire::cbor {

struct ReaderOptions final {
    // skip 允许的最大嵌套深度（数组/map/tag/不定长容器每层 +1）。
    std::size_t max_depth{cborwire::core::kDefaultMaxNestingDepth};
};

/**
 * @brief 基于游标的 CBOR 解码器（借用输入，不拥有字节）。
 *
 * 约定：
 * - 每个 read_* 成功时返回空 error_code，并把 position() 推进到该数据项之后；
 * - 失败返回 errc::unexpected_end（截断）或 errc::invalid_data（头部/编码不符），
 *   此时 position() 未定义，调用方应视为本次解码终止，不要尝试重新同步；
 * - 任何情况下都不会越界读取输入。
 *
 * 定长读取（read_u32 等）要求 additional info 与类型位宽完全一致，
 * 最小长度编码的同一数值会被拒绝；varint 读取接受 ai 0..27。
 *
 * 注意：
 * - 输入字节必须比 Reader 活得更久；
 * - 本类不做线程安全保证（多个 Reader 可以共享同一段只读输入）。
 */
class Reader final {
public:
    explicit Reader(bytes_view in, ReaderOptions options = {}) noexcept;

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return in_.size() - pos_; }
    [[nodiscard]] bool at_end() const noexcept { return pos_ == in_.size(); }

    // 最近一次失败的诊断信息（例如 "expected u32 header 0x1a, got 0x05"）。
    [[nodiscard]] const std::string &error_message() const noexcept { return error_message_; }

    std::error_code read_bool(bool &out) noexcept;
    std::error_code read_null() noexcept;

    std::error_code read_u8(std::uint8_t &out) noexcept;
    std::error_code read_u16(std::uint16_t &out) noexcept;
    std::error_code read_u32(std::uint32_t &out) noexcept;
    std::error_code read_u64(std::uint64_t &out) noexcept;

    std::error_code read_i8(std::int8_t &out) noexcept;
    std::error_code read_i16(std::int16_t &out) noexcept;
    std::error_code read_i32(std::int32_t &out) noexcept;
    std::error_code read_i64(std::int64_t &out) noexcept;

    std::error_code read_uvarint(std::uint64_t &out) noexcept;
    std::error_code read_ivarint(std::int64_t &out) noexcept;

    std::error_code read_f16(float &out) noexcept;
    std::error_code read_f32(float &out) noexcept;
    std::error_code read_f64(double &out) noexcept;

    // 文本串会做 UTF-8 校验；*_view 版本返回指向输入的零拷贝视图。
    std::error_code read_string(std::string &out) noexcept;
    std::error_code read_string_view(std::string_view &out) noexcept;
    std::error_code read_bytes(std::vector<byte> &out) noexcept;
    std::error_code read_bytes_view(bytes_view &out) noexcept;

    std::error_code read_array_header(std::uint64_t &count) noexcept;
    std::error_code read_tag_header(std::uint64_t &tag) noexcept;

    std::error_code read_byte(byte &out) noexcept;
    std::error_code peek_byte(byte &out) noexcept;

    /**
     * @brief 跳过恰好一个格式正确的数据项（任意类型，含 map 与不定长容器）。
     *
     * 用于前向兼容：解码端遇到不认识的字段时调用。
     */
    std::error_code skip() noexcept;

private:
    std::error_code fail(errc code, std::string_view message) noexcept;
    std::error_code fail_header(std::string_view expected, byte actual) noexcept;

    std::error_code take_header(byte &out) noexcept;
    std::error_code read_argument(std::uint8_t ai, std::uint64_t &out) noexcept;
    std::error_code read_length(major_type expected, std::string_view what, std::uint64_t &out) noexcept;
    std::error_code take_payload(std::uint64_t n, bytes_view &out) noexcept;

    template <class UInt>
    std::error_code read_be_uint(UInt &out) noexcept;

    template <class UInt>
    std::error_code read_fixed_unsigned(std::string_view what, UInt &out) noexcept;

    template <class SInt, class UInt>
    std::error_code read_fixed_signed(std::string_view what, SInt &out) noexcept;

    std::error_code skip_item(std::size_t depth) noexcept;
    std::error_code skip_indefinite(major_type major, std::size_t depth) noexcept;

    bytes_view in_{};
    std::size_t pos_{0};
    ReaderOptions options_{};
    std::string error_message_;
};

} // namespace cborwire::cbor
