#include <cborwire/cbor/reader.hpp>
#include <cborwire/cbor/writer.hpp>
#include <cborwire/core/log.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using namespace cborwire::cbor;

namespace {

// 新版本的记录：比旧版本多了 tags 与 score 两个字段。
struct EntityV2 {
    std::uint32_t id{0};
    std::string name;
    std::vector<std::string> tags;
    float score{0.0f};
};

// 旧版本读端只认识前两个字段。
struct EntityV1 {
    std::uint32_t id{0};
    std::string name;
};

// 记录编码为：数组头（字段个数）+ 按声明顺序排列的字段。
void encode(Writer &w, const EntityV2 &e) {
    w.write_array_header(4);
    w.write_u32(e.id);
    w.write_string(e.name);
    w.write_array_header(e.tags.size());
    for (const auto &tag : e.tags) {
        w.write_string(tag);
    }
    w.write_f16(e.score);
}

std::error_code decode(Reader &r, EntityV1 &out) {
    std::uint64_t fields = 0;
    auto ec = r.read_array_header(fields);
    if (ec) {
        return ec;
    }
    if (fields < 2) {
        return make_error_code(errc::invalid_data);
    }
    ec = r.read_u32(out.id);
    if (ec) {
        return ec;
    }
    ec = r.read_string(out.name);
    if (ec) {
        return ec;
    }
    // 不认识的尾部字段直接跳过
    for (std::uint64_t i = 2; i < fields; ++i) {
        ec = r.skip();
        if (ec) {
            return ec;
        }
    }
    return {};
}

} // namespace

int main() {
    std::cout << "=== 记录编解码示例（前向兼容） ===\n\n";

    cborwire::core::set_log_level(cborwire::core::LogLevel::debug);

    const EntityV2 entity{7, "sensor-7", {"lab", "north"}, 0.75f};

    Writer w;
    encode(w, entity);
    const auto encoded = std::move(w).finish();
    std::cout << "编码成功: " << encoded.size() << " 字节\n";

    Reader r(bytes_view{encoded.data(), encoded.size()});
    EntityV1 decoded;
    auto ec = decode(r, decoded);
    if (ec) {
        std::cerr << "解码失败: " << ec.message() << " (" << r.error_message() << ")\n";
        return 1;
    }
    std::cout << "旧版本解码成功: id=" << decoded.id << " name=\"" << decoded.name << "\"\n";
    std::cout << "已跳过未知字段，消费 " << r.position() << " / " << encoded.size() << " 字节\n";

    // 截断输入：解码失败，并输出 debug 日志
    Reader truncated(bytes_view{encoded.data(), encoded.size() - 3});
    EntityV1 partial;
    ec = decode(truncated, partial);
    if (!ec) {
        std::cerr << "截断输入不应解码成功\n";
        return 1;
    }
    std::cout << "截断输入被拒绝: " << ec.message() << " (" << truncated.error_message()
              << ")\n";

    return 0;
}
