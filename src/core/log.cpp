#include "cborwire/core/log.hpp"

#include "log_internal.hpp"

#include <spdlog/spdlog.h>

namespace cborwire::core {
namespace {

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::trace:
        return spdlog::level::trace;
    case LogLevel::debug:
        return spdlog::level::debug;
    case LogLevel::info:
        return spdlog::level::info;
    case LogLevel::warn:
        return spdlog::level::warn;
    case LogLevel::error:
        return spdlog::level::err;
    case LogLevel::critical:
        return spdlog::level::critical;
    case LogLevel::off:
        return spdlog::level::off;
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::trace;
    case spdlog::level::debug:
        return LogLevel::debug;
    case spdlog::level::info:
        return LogLevel::info;
    case spdlog::level::warn:
        return LogLevel::warn;
    case spdlog::level::err:
        return LogLevel::error;
    case spdlog::level::critical:
        return LogLevel::critical;
    case spdlog::level::off:
        return LogLevel::off;
    default:
        return LogLevel::off;
    }
}

} // namespace

void set_log_level(LogLevel level) noexcept {
    // 仅设置 spdlog 全局级别；sink/格式由业务侧自行配置。
    spdlog::set_level(to_spdlog_level(level));
}

LogLevel log_level() noexcept { return from_spdlog_level(spdlog::get_level()); }

namespace detail {

void log_decode_failure(std::size_t offset,
                        const std::error_code &ec,
                        std::string_view message) noexcept {
    if (!spdlog::should_log(spdlog::level::debug)) {
        return;
    }
    spdlog::debug("cbor decode failed at offset {}: [{}] {}{}{}",
                  offset,
                  ec.category().name(),
                  ec.message(),
                  message.empty() ? "" : ": ",
                  message);
}

} // namespace detail

} // namespace cborwire::core
