#pragma once

#include <cstdint>
#include <string>

namespace blobwire::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 本库内部日志使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 业务侧可通过 set_log_level 调整全局日志级别。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

/**
 * @brief 按通道注入的诊断配置（替代进程级的调试开关）。
 *
 * 说明：
 * - logger_name 为空或未注册时使用 spdlog 默认 logger；
 * - 测试可注册独立 logger（例如 ostream sink），只观察自己通道的输出。
 */
struct DiagnosticOptions final {
    std::string logger_name{};

    // 每帧收发输出一行 trace（通道名 + 长度）。
    bool trace_transfers{false};

    // 解码失败时输出缓冲区内容（offset / 总长度 / 原始字节）。
    bool dump_on_decode_error{true};
};

} // namespace blobwire::core
