#pragma once

#include "blobwire/codec/capability.hpp"
#include "blobwire/codec/error.hpp"
#include "blobwire/codec/primitive.hpp"

#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace blobwire::codec {

/**
 * @brief Concept 约束：值类型与字节串之间的无损投影。
 *
 * - to_string(v)：投影为字节串（可返回 std::string 或 const std::string&）
 * - of_string(s, out)：从字节串还原；非法输入返回 errc::decode_error
 *
 * 要求 of_string(to_string(v)) 还原出与 v 相等的值。
 */
template <typename P>
concept Stringable = requires(const typename P::value_type& v,
                              std::string_view s,
                              typename P::value_type& out) {
  { P::to_string(v) } -> std::convertible_to<std::string>;
  { P::of_string(s, out) } -> std::same_as<std::error_code>;
};

// std::string 的恒等投影。
struct StringProjection final {
  using value_type = std::string;

  static const std::string& to_string(const value_type& v) noexcept { return v; }

  static std::error_code of_string(std::string_view s, value_type& out) {
    out.assign(s.data(), s.size());
    return {};
  }
};

/**
 * @brief 无符号整数的十进制文本投影。
 *
 * 只接受规范形式：非空、全数字、无符号、无多余前导 0，且不超出 UInt 范围；
 * 这样 to_string/of_string 互为逆映射。
 */
template <typename UInt>
struct DecimalProjection final {
  static_assert(std::is_unsigned_v<UInt>);

  using value_type = UInt;

  static std::string to_string(const value_type& v) { return std::to_string(v); }

  static std::error_code of_string(std::string_view s, value_type& out) {
    if (s.empty() || (s.size() > 1 && s.front() == '0')) {
      return make_error_code(errc::decode_error);
    }
    value_type v{};
    const auto* first = s.data();
    const auto* last = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last) {
      return make_error_code(errc::decode_error);
    }
    out = v;
    return {};
  }
};

/**
 * @brief 标量包装：4 字节长度 + 投影字节串的原始字节。
 *
 * 大多数领域叶子类型（hash、标识符、任意 blob）都建立在它之上。
 */
template <Stringable P>
struct ScalarWrapper final {
  using value_type = typename P::value_type;

  static std::size_t size_of(const value_type& v) {
    decltype(auto) s = P::to_string(v);
    return core::kLengthPrefixSize + std::string_view(s).size();
  }

  static asio::awaitable<std::error_code> write(core::CursorBuffer& buf, const value_type& v) {
    decltype(auto) s = P::to_string(v);
    const std::string_view view(s);
    if (!fits_length_prefix(view.size())) {
      co_return make_error_code(errc::length_overflow);
    }
    auto ec = co_await write_u32(buf, static_cast<std::uint32_t>(view.size()));
    if (ec) {
      co_return ec;
    }
    co_return co_await write_string(buf, view);
  }

  static asio::awaitable<std::error_code> read(core::CursorBuffer& buf, value_type& out) {
    std::uint32_t len = 0;
    auto ec = co_await read_u32(buf, len);
    if (ec) {
      co_return ec;
    }
    std::string raw;
    ec = co_await read_string(buf, len, raw);
    if (ec) {
      co_return ec;
    }
    co_return P::of_string(raw, out);
  }

  static std::string pretty(const value_type& v) {
    std::ostringstream oss;
    oss << std::quoted(std::string_view(P::to_string(v)));
    return oss.str();
  }
};

using String = ScalarWrapper<StringProjection>;

template <typename UInt>
using Decimal = ScalarWrapper<DecimalProjection<UInt>>;

}  // namespace blobwire::codec
