#pragma once

#include "blobwire/core/common.hpp"
#include "blobwire/core/cursor_buffer.hpp"

#include <asio/awaitable.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace blobwire::codec {

/**
 * @brief 基础定长编解码（大端 / 网络字节序）。
 *
 * 每个函数：
 * 1. 经 CursorBuffer::async_advance 做越界检查并触发就绪钩子；
 * 2. 按大端顺序搬运字节；
 * 3. 游标恰好前移对应宽度。
 *
 * 宽度：char/u8 = 1，u16 = 2，u32 = 4，u64 = 8；
 * 原始字节串按声明长度写入，无终止符、无填充。
 * 失败时返回 core::errc::buffer_overrun（或钩子上报的错误），输出参数不可用。
 */

asio::awaitable<std::error_code> write_u8(core::CursorBuffer &buf, std::uint8_t v);
asio::awaitable<std::error_code> write_u16(core::CursorBuffer &buf, std::uint16_t v);
asio::awaitable<std::error_code> write_u32(core::CursorBuffer &buf, std::uint32_t v);
asio::awaitable<std::error_code> write_u64(core::CursorBuffer &buf, std::uint64_t v);
asio::awaitable<std::error_code> write_char(core::CursorBuffer &buf, char v);
asio::awaitable<std::error_code> write_bytes(core::CursorBuffer &buf, core::bytes_view v);
asio::awaitable<std::error_code> write_string(core::CursorBuffer &buf, std::string_view v);

asio::awaitable<std::error_code> read_u8(core::CursorBuffer &buf, std::uint8_t &out);
asio::awaitable<std::error_code> read_u16(core::CursorBuffer &buf, std::uint16_t &out);
asio::awaitable<std::error_code> read_u32(core::CursorBuffer &buf, std::uint32_t &out);
asio::awaitable<std::error_code> read_u64(core::CursorBuffer &buf, std::uint64_t &out);
asio::awaitable<std::error_code> read_char(core::CursorBuffer &buf, char &out);

// 精确读取 len 个字节（与内容中是否出现 0 无关）。
asio::awaitable<std::error_code> read_bytes(core::CursorBuffer &buf,
                                            std::size_t len,
                                            std::vector<core::byte> &out);
asio::awaitable<std::error_code> read_string(core::CursorBuffer &buf,
                                             std::size_t len,
                                             std::string &out);

} // namespace blobwire::codec
