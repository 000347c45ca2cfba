#pragma once

#include "blobwire/core/common.hpp"
#include "blobwire/core/cursor_buffer.hpp"
#include "blobwire/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace blobwire::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 典型使用场景：
 * - 测试里用 “00 00 00 02 ...” 直接写出期望的线上字节；
 * - 解码失败时把缓冲区以 hexdump 形式输出，便于人工比对协议字段。
 */

struct HexDumpOptions final {
    // 每行字节数（典型 16/32）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分会打印截断提示。
    std::size_t max_bytes{256};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};

    // 是否输出 ASCII 侧栏（仅展示可打印字符，其余用 '.'）。
    bool show_ascii{true};
};

[[nodiscard]] std::string hex_dump(core::bytes_view bytes,
                                   HexDumpOptions options = {});

/**
 * @brief 输出 CursorBuffer 的诊断视图。
 *
 * 首行为 “[[ offset:N ready:R len:L ]]”，其后是已就绪部分的 hexdump；
 * 未就绪的字节内容无意义，不输出。
 */
[[nodiscard]] std::string describe_buffer(const core::CursorBuffer &buf,
                                          HexDumpOptions options = {});

/**
 * @brief 解析 16 进制字符串为 bytes。
 *
 * 支持：
 * - 大小写 hex；
 * - 分隔符：空白、逗号、冒号、连字符、下划线；
 * - 可选的 0x/0X 前缀（会被忽略）。
 *
 * 失败返回 core::errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<core::byte> &out) noexcept;

} // namespace blobwire::utils
