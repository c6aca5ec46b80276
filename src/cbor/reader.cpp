#include "cborwire/cbor/reader.hpp"

#include "cborwire/cbor/half.hpp"

#include "core/log_internal.hpp"

#include <bit>
#include <limits>
#include <string>

namespace cborwire::cbor {
namespace {

constexpr std::size_t kValidUtf8 = static_cast<std::size_t>(-1);

[[nodiscard]] std::string hex_byte(byte b) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string s = "0x";
    s.push_back(kDigits[(b >> 4) & 0x0Fu]);
    s.push_back(kDigits[b & 0x0Fu]);
    return s;
}

[[nodiscard]] bool in_range(byte b, byte lo, byte hi) noexcept {
    return b >= lo && b <= hi;
}

/*
 * UTF-8 校验（RFC 3629）：拒绝过长编码、代理区 U+D800..U+DFFF、
 * 超过 U+10FFFF 的码点以及被截断的多字节序列。
 * 返回第一个非法序列的起始偏移；全部合法返回 kValidUtf8。
 */
[[nodiscard]] std::size_t find_invalid_utf8(bytes_view s) noexcept {
    std::size_t i = 0;
    while (i < s.size()) {
        const byte lead = s[i];
        if (lead < 0x80u) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        byte second_lo = 0x80u;
        byte second_hi = 0xBFu;
        if (in_range(lead, 0xC2u, 0xDFu)) {
            len = 2;
        } else if (lead == 0xE0u) {
            len = 3;
            second_lo = 0xA0u;
        } else if (in_range(lead, 0xE1u, 0xECu) || in_range(lead, 0xEEu, 0xEFu)) {
            len = 3;
        } else if (lead == 0xEDu) {
            len = 3;
            second_hi = 0x9Fu;
        } else if (lead == 0xF0u) {
            len = 4;
            second_lo = 0x90u;
        } else if (in_range(lead, 0xF1u, 0xF3u)) {
            len = 4;
        } else if (lead == 0xF4u) {
            len = 4;
            second_hi = 0x8Fu;
        } else {
            return i;
        }

        if (s.size() - i < len) {
            return i;
        }
        if (!in_range(s[i + 1], second_lo, second_hi)) {
            return i;
        }
        for (std::size_t k = 2; k < len; ++k) {
            if (!in_range(s[i + k], 0x80u, 0xBFu)) {
                return i;
            }
        }
        i += len;
    }
    return kValidUtf8;
}

[[nodiscard]] std::string_view major_name(major_type major) noexcept {
    switch (major) {
    case major_type::unsigned_int:
        return "unsigned integer";
    case major_type::negative_int:
        return "negative integer";
    case major_type::byte_string:
        return "byte string";
    case major_type::text_string:
        return "text string";
    case major_type::array:
        return "array";
    case major_type::map:
        return "map";
    case major_type::tag:
        return "tag";
    case major_type::simple:
        return "simple/float";
    }
    return "unknown";
}

} // namespace

/*
 * Reader 的实现模型：
 * - in_ 为借用的只读输入，pos_ 为游标，始终满足 pos_ <= in_.size()；
 * - 所有多字节读取先比较 remaining() 与所需宽度（不计算 pos_ + n，避免溢出），
 *   不足即返回 unexpected_end；
 * - 头部/主类型不符返回 invalid_data，并把“期望 vs 实际”写入 error_message_；
 * - skip 递归下降，深度受 options_.max_depth 限制。
 */
Reader::Reader(bytes_view in, ReaderOptions options) noexcept
    : in_(in), options_(options) {}

std::error_code Reader::fail(errc code, std::string_view message) noexcept {
    const auto ec = make_error_code(code);
    error_message_.assign(message.data(), message.size());
    core::detail::log_decode_failure(pos_, ec, error_message_);
    return ec;
}

std::error_code Reader::fail_header(std::string_view expected, byte actual) noexcept {
    std::string message = "expected ";
    message.append(expected);
    message.append(", got ");
    message.append(hex_byte(actual));
    return fail(errc::invalid_data, message);
}

std::error_code Reader::take_header(byte &out) noexcept {
    if (pos_ >= in_.size()) {
        return fail(errc::unexpected_end, "expected header byte, input exhausted");
    }
    out = in_[pos_++];
    return {};
}

template <class UInt>
std::error_code Reader::read_be_uint(UInt &out) noexcept {
    if (remaining() < sizeof(UInt)) {
        return fail(errc::unexpected_end,
                    "need " + std::to_string(sizeof(UInt)) + " bytes at offset " +
                        std::to_string(pos_) + ", " + std::to_string(remaining()) +
                        " remaining");
    }
    UInt v = 0;
    for (std::size_t i = 0; i < sizeof(UInt); ++i) {
        v = static_cast<UInt>((static_cast<std::uint64_t>(v) << 8) | in_[pos_ + i]);
    }
    pos_ += sizeof(UInt);
    out = v;
    return {};
}

std::error_code Reader::read_argument(std::uint8_t ai, std::uint64_t &out) noexcept {
    if (ai <= kAiMaxInline) {
        out = ai;
        return {};
    }
    switch (ai) {
    case kAiOneByte: {
        std::uint8_t v = 0;
        auto ec = read_be_uint(v);
        out = v;
        return ec;
    }
    case kAiTwoBytes: {
        std::uint16_t v = 0;
        auto ec = read_be_uint(v);
        out = v;
        return ec;
    }
    case kAiFourBytes: {
        std::uint32_t v = 0;
        auto ec = read_be_uint(v);
        out = v;
        return ec;
    }
    case kAiEightBytes:
        return read_be_uint(out);
    default:
        return fail(errc::invalid_data,
                    "unsupported additional info " + std::to_string(ai));
    }
}

std::error_code Reader::read_length(major_type expected,
                                    std::string_view what,
                                    std::uint64_t &out) noexcept {
    byte h = 0;
    auto ec = take_header(h);
    if (ec) {
        return ec;
    }
    if (major_of(h) != expected) {
        std::string desc(what);
        desc.append(" (major type ");
        desc.append(std::to_string(static_cast<unsigned>(expected)));
        desc.append(")");
        return fail_header(desc, h);
    }
    if (additional_info_of(h) == kAiIndefinite) {
        return fail(errc::invalid_data,
                    "indefinite-length " + std::string(what) + " is not supported here");
    }
    return read_argument(additional_info_of(h), out);
}

std::error_code Reader::take_payload(std::uint64_t n, bytes_view &out) noexcept {
    if (n > remaining()) {
        return fail(errc::unexpected_end,
                    "payload of " + std::to_string(n) + " bytes at offset " +
                        std::to_string(pos_) + " exceeds " + std::to_string(remaining()) +
                        " remaining");
    }
    const auto len = static_cast<std::size_t>(n);
    out = in_.subspan(pos_, len);
    pos_ += len;
    return {};
}

template <class UInt>
std::error_code Reader::read_fixed_unsigned(std::string_view what, UInt &out) noexcept {
    byte h = 0;
    auto ec = take_header(h);
    if (ec) {
        return ec;
    }
    const byte expected = make_header(major_type::unsigned_int, fixed_additional_info<UInt>());
    if (h != expected) {
        return fail_header(std::string(what) + " header " + hex_byte(expected), h);
    }
    return read_be_uint(out);
}

template <class SInt, class UInt>
std::error_code Reader::read_fixed_signed(std::string_view what, SInt &out) noexcept {
    static_assert(sizeof(SInt) == sizeof(UInt));
    byte h = 0;
    auto ec = take_header(h);
    if (ec) {
        return ec;
    }
    const byte positive = make_header(major_type::unsigned_int, fixed_additional_info<UInt>());
    const byte negative = make_header(major_type::negative_int, fixed_additional_info<UInt>());
    if (h != positive && h != negative) {
        return fail_header(std::string(what) + " header " + hex_byte(positive) + " or " +
                               hex_byte(negative),
                           h);
    }

    UInt v = 0;
    ec = read_be_uint(v);
    if (ec) {
        return ec;
    }
    // 定长写端不会产生超出有符号范围的幅值；出现即视为非法数据。
    if (v > static_cast<UInt>(std::numeric_limits<SInt>::max())) {
        return fail(errc::invalid_data, std::string(what) + " magnitude out of range");
    }
    const auto magnitude = static_cast<SInt>(v);
    out = (h == positive) ? magnitude : static_cast<SInt>(-1 - magnitude);
    return {};
}

std::error_code Reader::read_bool(bool &out) noexcept {
    byte h = 0;
    auto ec = take_header(h);
    if (ec) {
        return ec;
    }
    if (h == kTrue) {
        out = true;
        return {};
    }
    if (h == kFalse) {
        out = false;
        return {};
    }
    return fail_header("bool 0xf4 or 0xf5", h);
}

std::error_code Reader::read_null() noexcept {
    byte h = 0;
    auto ec = take_header(h);
    if (ec) {
        return ec;
    }
    if (h != kNull) {
        return fail_header("null 0xf6", h);
    }
    return {};
}

std::error_code Reader::read_u8(std::uint8_t &out) noexcept {
    return read_fixed_unsigned<std::uint8_t>("u8", out);
}

std::error_code Reader::read_u16(std::uint16_t &out) noexcept {
    return read_fixed_unsigned<std::uint16_t>("u16", out);
}

std::error_code Reader::read_u32(std::uint32_t &out) noexcept {
    return read_fixed_unsigned<std::uint32_t>("u32", out);
}

std::error_code Reader::read_u64(std::uint64_t &out) noexcept {
    return read_fixed_unsigned<std::uint64_t>("u64", out);
}

std::error_code Reader::read_i8(std::int8_t &out) noexcept {
    return read_fixed_signed<std::int8_t, std::uint8_t>("i8", out);
}

std::error_code Reader::read_i16(std::int16_t &out) noexcept {
    return read_fixed_signed<std::int16_t, std::uint16_t>("i16", out);
}

std::error_code Reader::read_i32(std::int32_t &out) noexcept {
    return read_fixed_signed<std::int32_t, std::uint32_t>("i32", out);
}

std::error_code Reader::read_i64(std::int64_t &out) noexcept {
    return read_fixed_signed<std::int64_t, std::uint64_t>("i64", out);
}

std::error_code Reader::read_uvarint(std::uint64_t &out) noexcept {
    byte h = 0;
    auto ec = take_header(h);
    if (ec) {
        return ec;
    }
    if (major_of(h) != major_type::unsigned_int) {
        return fail_header("uvarint (major type 0)", h);
    }
    return read_argument(additional_info_of(h), out);
}

std::error_code Reader::read_ivarint(std::int64_t &out) noexcept {
    byte h = 0;
    auto ec = take_header(h);
    if (ec) {
        return ec;
    }
    const auto major = major_of(h);
    if (major != major_type::unsigned_int && major != major_type::negative_int) {
        return fail_header("ivarint (major type 0 or 1)", h);
    }
    std::uint64_t v = 0;
    ec = read_argument(additional_info_of(h), v);
    if (ec) {
        return ec;
    }
    if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return fail(errc::invalid_data, "ivarint magnitude out of range");
    }
    const auto magnitude = static_cast<std::int64_t>(v);
    out = (major == major_type::unsigned_int) ? magnitude : -1 - magnitude;
    return {};
}

std::error_code Reader::read_f16(float &out) noexcept {
    byte h = 0;
    auto ec = take_header(h);
    if (ec) {
        return ec;
    }
    if (h != kHalfFloat) {
        return fail_header("f16 header 0xf9", h);
    }
    std::uint16_t bits = 0;
    ec = read_be_uint(bits);
    if (ec) {
        return ec;
    }
    out = from_f16(bits);
    return {};
}

std::error_code Reader::read_f32(float &out) noexcept {
    byte h = 0;
    auto ec = take_header(h);
    if (ec) {
        return ec;
    }
    if (h != kSingleFloat) {
        return fail_header("f32 header 0xfa", h);
    }
    std::uint32_t bits = 0;
    ec = read_be_uint(bits);
    if (ec) {
        return ec;
    }
    out = std::bit_cast<float>(bits);
    return {};
}

std::error_code Reader::read_f64(double &out) noexcept {
    byte h = 0;
    auto ec = take_header(h);
    if (ec) {
        return ec;
    }
    if (h != kDoubleFloat) {
        return fail_header("f64 header 0xfb", h);
    }
    std::uint64_t bits = 0;
    ec = read_be_uint(bits);
    if (ec) {
        return ec;
    }
    out = std::bit_cast<double>(bits);
    return {};
}

std::error_code Reader::read_string_view(std::string_view &out) noexcept {
    std::uint64_t len = 0;
    auto ec = read_length(major_type::text_string, "text string", len);
    if (ec) {
        return ec;
    }
    const auto start = pos_;
    bytes_view payload{};
    ec = take_payload(len, payload);
    if (ec) {
        return ec;
    }
    const auto bad = find_invalid_utf8(payload);
    if (bad != kValidUtf8) {
        return fail(errc::invalid_data,
                    "invalid UTF-8 in text string at offset " + std::to_string(start + bad));
    }
    out = std::string_view{reinterpret_cast<const char *>(payload.data()), payload.size()};
    return {};
}

std::error_code Reader::read_string(std::string &out) noexcept {
    std::string_view view;
    auto ec = read_string_view(view);
    if (ec) {
        return ec;
    }
    out.assign(view.data(), view.size());
    return {};
}

std::error_code Reader::read_bytes_view(bytes_view &out) noexcept {
    std::uint64_t len = 0;
    auto ec = read_length(major_type::byte_string, "byte string", len);
    if (ec) {
        return ec;
    }
    return take_payload(len, out);
}

std::error_code Reader::read_bytes(std::vector<byte> &out) noexcept {
    bytes_view view{};
    auto ec = read_bytes_view(view);
    if (ec) {
        return ec;
    }
    out.assign(view.begin(), view.end());
    return {};
}

std::error_code Reader::read_array_header(std::uint64_t &count) noexcept {
    return read_length(major_type::array, "array", count);
}

std::error_code Reader::read_tag_header(std::uint64_t &tag) noexcept {
    return read_length(major_type::tag, "tag", tag);
}

std::error_code Reader::read_byte(byte &out) noexcept { return take_header(out); }

std::error_code Reader::peek_byte(byte &out) noexcept {
    if (pos_ >= in_.size()) {
        return fail(errc::unexpected_end, "peek past end of input");
    }
    out = in_[pos_];
    return {};
}

std::error_code Reader::skip() noexcept { return skip_item(0); }

std::error_code Reader::skip_item(std::size_t depth) noexcept {
    if (depth > options_.max_depth) {
        return fail(errc::invalid_data,
                    "nesting depth exceeds limit " + std::to_string(options_.max_depth));
    }

    byte h = 0;
    auto ec = take_header(h);
    if (ec) {
        return ec;
    }
    const auto major = major_of(h);
    const auto ai = additional_info_of(h);

    if (major == major_type::simple) {
        if (ai <= kAiMaxInline) {
            return {};
        }
        if (ai == kAiIndefinite) {
            return fail(errc::invalid_data, "unexpected break byte 0xff");
        }
        const auto width = argument_width(ai);
        if (width == 0) {
            return fail(errc::invalid_data,
                        "reserved additional info " + std::to_string(ai) + " in simple value");
        }
        bytes_view ignored{};
        return take_payload(width, ignored);
    }

    if (ai == kAiIndefinite) {
        switch (major) {
        case major_type::byte_string:
        case major_type::text_string:
        case major_type::array:
        case major_type::map:
            return skip_indefinite(major, depth);
        default:
            return fail(errc::invalid_data,
                        "indefinite length not allowed for " + std::string(major_name(major)));
        }
    }

    std::uint64_t n = 0;
    ec = read_argument(ai, n);
    if (ec) {
        return ec;
    }

    switch (major) {
    case major_type::unsigned_int:
    case major_type::negative_int:
        // 整数值已随参数一起读完
        return {};
    case major_type::byte_string:
    case major_type::text_string: {
        bytes_view ignored{};
        return take_payload(n, ignored);
    }
    case major_type::array:
        for (std::uint64_t i = 0; i < n; ++i) {
            ec = skip_item(depth + 1);
            if (ec) {
                return ec;
            }
        }
        return {};
    case major_type::map:
        for (std::uint64_t i = 0; i < n; ++i) {
            ec = skip_item(depth + 1);
            if (ec) {
                return ec;
            }
            ec = skip_item(depth + 1);
            if (ec) {
                return ec;
            }
        }
        return {};
    case major_type::tag:
        return skip_item(depth + 1);
    default:
        return fail(errc::invalid_data,
                    "unexpected major type " + std::to_string(static_cast<unsigned>(major)));
    }
}

std::error_code Reader::skip_indefinite(major_type major, std::size_t depth) noexcept {
    const bool is_string =
        major == major_type::byte_string || major == major_type::text_string;
    std::uint64_t items = 0;
    for (;;) {
        if (pos_ >= in_.size()) {
            return fail(errc::unexpected_end,
                        "missing break byte for indefinite-length " +
                            std::string(major_name(major)));
        }
        const byte next = in_[pos_];
        if (next == kBreak) {
            ++pos_;
            break;
        }
        // 不定长字符串只能由同类型的定长分片组成。
        if (is_string &&
            (major_of(next) != major || additional_info_of(next) == kAiIndefinite)) {
            return fail_header("definite-length " + std::string(major_name(major)) + " chunk",
                               next);
        }
        auto ec = skip_item(depth + 1);
        if (ec) {
            return ec;
        }
        ++items;
    }
    if (major == major_type::map && (items % 2) != 0) {
        return fail(errc::invalid_data, "indefinite-length map has a key without a value");
    }
    return {};
}

} // namespace cborwire::cbor
