#pragma once

#include "blobwire/codec/capability.hpp"
#include "blobwire/codec/error.hpp"
#include "blobwire/codec/primitive.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace blobwire::codec {

// 定宽无符号整数（大端）。
template <typename UInt>
struct Integer final {
  static_assert(std::is_same_v<UInt, std::uint8_t> || std::is_same_v<UInt, std::uint16_t> ||
                std::is_same_v<UInt, std::uint32_t> || std::is_same_v<UInt, std::uint64_t>);

  using value_type = UInt;

  static std::size_t size_of(const value_type&) noexcept { return sizeof(UInt); }

  static asio::awaitable<std::error_code> write(core::CursorBuffer& buf, const value_type& v) {
    if constexpr (sizeof(UInt) == 1) {
      co_return co_await write_u8(buf, v);
    } else if constexpr (sizeof(UInt) == 2) {
      co_return co_await write_u16(buf, v);
    } else if constexpr (sizeof(UInt) == 4) {
      co_return co_await write_u32(buf, v);
    } else {
      co_return co_await write_u64(buf, v);
    }
  }

  static asio::awaitable<std::error_code> read(core::CursorBuffer& buf, value_type& out) {
    if constexpr (sizeof(UInt) == 1) {
      co_return co_await read_u8(buf, out);
    } else if constexpr (sizeof(UInt) == 2) {
      co_return co_await read_u16(buf, out);
    } else if constexpr (sizeof(UInt) == 4) {
      co_return co_await read_u32(buf, out);
    } else {
      co_return co_await read_u64(buf, out);
    }
  }

  static std::string pretty(const value_type& v) { return std::to_string(v); }
};

using UInt8 = Integer<std::uint8_t>;
using UInt16 = Integer<std::uint16_t>;
using UInt32 = Integer<std::uint32_t>;
using UInt64 = Integer<std::uint64_t>;

struct Char final {
  using value_type = char;

  static std::size_t size_of(const value_type&) noexcept { return 1; }

  static asio::awaitable<std::error_code> write(core::CursorBuffer& buf, const value_type& v) {
    co_return co_await write_char(buf, v);
  }

  static asio::awaitable<std::error_code> read(core::CursorBuffer& buf, value_type& out) {
    co_return co_await read_char(buf, out);
  }

  static std::string pretty(const value_type& v) { return std::string{'\'', v, '\''}; }
};

// 1 字节：0 = false，1 = true；其它取值视为 decode_error。
struct Bool final {
  using value_type = bool;

  static std::size_t size_of(const value_type&) noexcept { return 1; }

  static asio::awaitable<std::error_code> write(core::CursorBuffer& buf, const value_type& v) {
    co_return co_await write_u8(buf, static_cast<std::uint8_t>(v ? 1 : 0));
  }

  static asio::awaitable<std::error_code> read(core::CursorBuffer& buf, value_type& out) {
    std::uint8_t raw = 0;
    auto ec = co_await read_u8(buf, raw);
    if (ec) {
      co_return ec;
    }
    if (raw > 1) {
      co_return make_error_code(errc::decode_error);
    }
    out = (raw == 1);
    co_return std::error_code{};
  }

  static std::string pretty(const value_type& v) { return v ? "true" : "false"; }
};

// 原始字节块：4 字节长度 + 原样字节。
struct Bytes final {
  using value_type = std::vector<core::byte>;

  static std::size_t size_of(const value_type& v) noexcept {
    return core::kLengthPrefixSize + v.size();
  }

  static asio::awaitable<std::error_code> write(core::CursorBuffer& buf, const value_type& v) {
    if (!fits_length_prefix(v.size())) {
      co_return make_error_code(errc::length_overflow);
    }
    auto ec = co_await write_u32(buf, static_cast<std::uint32_t>(v.size()));
    if (ec) {
      co_return ec;
    }
    co_return co_await write_bytes(buf, core::bytes_view{v.data(), v.size()});
  }

  static asio::awaitable<std::error_code> read(core::CursorBuffer& buf, value_type& out) {
    std::uint32_t len = 0;
    auto ec = co_await read_u32(buf, len);
    if (ec) {
      co_return ec;
    }
    co_return co_await read_bytes(buf, len, out);
  }

  static std::string pretty(const value_type& v) {
    return "<" + std::to_string(v.size()) + " bytes>";
  }
};

}  // namespace blobwire::codec
