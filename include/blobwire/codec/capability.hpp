#pragma once

#include "blobwire/codec/error.hpp"
#include "blobwire/core/common.hpp"
#include "blobwire/core/cursor_buffer.hpp"

#include <asio/awaitable.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace blobwire::codec {

/**
 * @brief Concept 约束：可被本库承载的“序列化能力”。
 *
 * 一个 Codec 是无状态类型，提供：
 * - value_type：被编码的值类型（需可默认构造）
 * - size_of(v)：write 将写出的精确字节数（只依赖 v 本身）
 * - write(buf, v)：游标恰好前移 size_of(v)
 * - read(buf, out)：游标恰好前移对应 write 写出的字节数
 * - pretty(v)：人类可读形式，仅用于诊断，不参与线上格式
 *
 * 精确长度律：容量为 size_of(v) 的新缓冲区被 write 完整写满；
 * 再用 read 读回，得到与 v 相等的值。
 */
template <typename C>
concept Codec = requires(const typename C::value_type& v,
                         typename C::value_type& out,
                         core::CursorBuffer& buf) {
  { C::size_of(v) } -> std::same_as<std::size_t>;
  { C::write(buf, v) } -> std::same_as<asio::awaitable<std::error_code>>;
  { C::read(buf, out) } -> std::same_as<asio::awaitable<std::error_code>>;
  { C::pretty(v) } -> std::convertible_to<std::string>;
};

// 计数/长度前缀为 4 字节无符号整数。
[[nodiscard]] constexpr bool fits_length_prefix(std::size_t n) noexcept {
  return n <= std::numeric_limits<std::uint32_t>::max();
}

/**
 * @brief 把 value 编码进一个容量恰为 size_of(value) 的新缓冲区。
 *
 * 写完后游标必须恰好停在容量处，否则返回 errc::size_mismatch。
 */
template <Codec C>
asio::awaitable<std::pair<std::error_code, std::vector<core::byte>>> async_encode(
  const typename C::value_type& value) {
  core::CursorBuffer buf(C::size_of(value));
  auto ec = co_await C::write(buf, value);
  if (ec) {
    co_return std::pair{ec, std::vector<core::byte>{}};
  }
  if (!buf.exhausted()) {
    co_return std::pair{make_error_code(errc::size_mismatch), std::vector<core::byte>{}};
  }
  co_return std::pair{std::error_code{}, std::move(buf).release()};
}

/**
 * @brief 从完整的内存字节解码一个值；输入必须被恰好消耗完。
 */
template <Codec C>
asio::awaitable<std::error_code> async_decode(core::bytes_view in, typename C::value_type& out) {
  auto buf = core::CursorBuffer::from_bytes(in);
  auto ec = co_await C::read(buf, out);
  if (ec) {
    co_return ec;
  }
  if (!buf.exhausted()) {
    co_return make_error_code(errc::size_mismatch);
  }
  co_return std::error_code{};
}

}  // namespace blobwire::codec
