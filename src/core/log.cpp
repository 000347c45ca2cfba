#include "blobwire/core/log.hpp"
#include "log_detail.hpp"

#include <spdlog/spdlog.h>

#include <array>

namespace blobwire::core {
namespace {

struct LevelMapping final {
    LogLevel level;
    spdlog::level::level_enum native;
};

// LogLevel 与 spdlog 级别一一对应；表外的 spdlog 取值（n_levels）按 off 处理。
constexpr std::array<LevelMapping, 7> kLevels{{
    {LogLevel::trace, spdlog::level::trace},
    {LogLevel::debug, spdlog::level::debug},
    {LogLevel::info, spdlog::level::info},
    {LogLevel::warn, spdlog::level::warn},
    {LogLevel::error, spdlog::level::err},
    {LogLevel::critical, spdlog::level::critical},
    {LogLevel::off, spdlog::level::off},
}};

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    for (const auto &m : kLevels) {
        if (m.level == level) {
            return m.native;
        }
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum native) noexcept {
    for (const auto &m : kLevels) {
        if (m.native == native) {
            return m.level;
        }
    }
    return LogLevel::off;
}

} // namespace

void set_log_level(LogLevel level) noexcept {
    // spdlog 可能被业务侧额外配置；这里仅做最小的全局级别设置。
    spdlog::set_level(to_spdlog_level(level));
}

LogLevel log_level() noexcept { return from_spdlog_level(spdlog::get_level()); }

namespace detail {

std::shared_ptr<spdlog::logger> resolve_logger(const DiagnosticOptions &options) {
    if (!options.logger_name.empty()) {
        if (auto logger = spdlog::get(options.logger_name)) {
            return logger;
        }
    }
    return spdlog::default_logger();
}

} // namespace detail

} // namespace blobwire::core
