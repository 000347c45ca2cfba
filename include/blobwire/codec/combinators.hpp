#pragma once

#include "blobwire/codec/capability.hpp"
#include "blobwire/codec/error.hpp"
#include "blobwire/codec/primitive.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace blobwire::codec {

// SequenceOf 解码时一次性预留的元素数上限，超出部分随 push_back 增长。
inline constexpr std::size_t kMaxSequenceReserve = 1024;

/**
 * @brief 有序序列：4 字节元素个数 + 依次排列的元素编码。
 *
 * 顺序严格保持（不排序、不去重）；size_of = 4 + 各元素 size_of 之和。
 */
template <Codec E>
struct SequenceOf final {
  using element_codec = E;
  using value_type = std::vector<typename E::value_type>;

  static std::size_t size_of(const value_type& v) {
    std::size_t total = core::kLengthPrefixSize;
    for (const auto& e : v) {
      total += E::size_of(e);
    }
    return total;
  }

  static asio::awaitable<std::error_code> write(core::CursorBuffer& buf, const value_type& v) {
    if (!fits_length_prefix(v.size())) {
      co_return make_error_code(errc::length_overflow);
    }
    auto ec = co_await write_u32(buf, static_cast<std::uint32_t>(v.size()));
    if (ec) {
      co_return ec;
    }
    for (const auto& e : v) {
      ec = co_await E::write(buf, e);
      if (ec) {
        co_return ec;
      }
    }
    co_return std::error_code{};
  }

  static asio::awaitable<std::error_code> read(core::CursorBuffer& buf, value_type& out) {
    std::uint32_t count = 0;
    auto ec = co_await read_u32(buf, count);
    if (ec) {
      co_return ec;
    }
    out.clear();
    // count 来自输入：预留元素数以“已到达的字节数”与固定上限为界，
    // 流式接收时 remaining() 只是声明的帧长，不能作为依据。
    const std::size_t arrived = buf.ready() - buf.offset();
    out.reserve(std::min({static_cast<std::size_t>(count), arrived, kMaxSequenceReserve}));
    for (std::uint32_t i = 0; i < count; ++i) {
      typename E::value_type e{};
      ec = co_await E::read(buf, e);
      if (ec) {
        co_return ec;
      }
      out.push_back(std::move(e));
    }
    co_return std::error_code{};
  }

  static std::string pretty(const value_type& v) {
    std::string s = "[";
    for (std::size_t i = 0; i < v.size(); ++i) {
      if (i != 0) {
        s += ", ";
      }
      s += E::pretty(v[i]);
    }
    s += "]";
    return s;
  }
};

/**
 * @brief 可选值：与 SequenceOf<E> 的 0/1 个元素同构。
 *
 * - none   -> count=0
 * - some v -> count=1 + E(v)
 * 解码时 count 不是 0/1 -> errc::malformed_optional（在读元素之前即拒绝）。
 */
template <Codec E>
struct Optional final {
  using element_codec = E;
  using value_type = std::optional<typename E::value_type>;

  static std::size_t size_of(const value_type& v) {
    return core::kLengthPrefixSize + (v ? E::size_of(*v) : 0);
  }

  static asio::awaitable<std::error_code> write(core::CursorBuffer& buf, const value_type& v) {
    auto ec = co_await write_u32(buf, v ? 1u : 0u);
    if (ec || !v) {
      co_return ec;
    }
    co_return co_await E::write(buf, *v);
  }

  static asio::awaitable<std::error_code> read(core::CursorBuffer& buf, value_type& out) {
    std::uint32_t count = 0;
    auto ec = co_await read_u32(buf, count);
    if (ec) {
      co_return ec;
    }
    if (count == 0) {
      out.reset();
      co_return std::error_code{};
    }
    if (count != 1) {
      co_return make_error_code(errc::malformed_optional);
    }
    typename E::value_type e{};
    ec = co_await E::read(buf, e);
    if (ec) {
      co_return ec;
    }
    out = std::move(e);
    co_return std::error_code{};
  }

  static std::string pretty(const value_type& v) {
    return v ? E::pretty(*v) : std::string{"<none>"};
  }
};

/**
 * @brief 有序二元组：K 的编码紧跟 V 的编码，中间无分隔、无长度前缀。
 *
 * 诊断形式带 first/second 标签，线上格式不含任何标签。
 */
template <Codec K, Codec V>
struct Pair final {
  using first_codec = K;
  using second_codec = V;
  using value_type = std::pair<typename K::value_type, typename V::value_type>;

  static std::size_t size_of(const value_type& v) {
    return K::size_of(v.first) + V::size_of(v.second);
  }

  static asio::awaitable<std::error_code> write(core::CursorBuffer& buf, const value_type& v) {
    auto ec = co_await K::write(buf, v.first);
    if (ec) {
      co_return ec;
    }
    co_return co_await V::write(buf, v.second);
  }

  static asio::awaitable<std::error_code> read(core::CursorBuffer& buf, value_type& out) {
    auto ec = co_await K::read(buf, out.first);
    if (ec) {
      co_return ec;
    }
    co_return co_await V::read(buf, out.second);
  }

  static std::string pretty(const value_type& v) {
    return "{first: " + K::pretty(v.first) + ", second: " + V::pretty(v.second) + "}";
  }
};

}  // namespace blobwire::codec
