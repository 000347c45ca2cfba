#include "blobwire/codec/primitive.hpp"

#include <algorithm>
#include <type_traits>

namespace blobwire::codec {
namespace {

template <class UInt>
asio::awaitable<std::error_code> write_be(core::CursorBuffer &buf, UInt v) {
    static_assert(std::is_unsigned_v<UInt>);
    core::mutable_bytes_view region;
    auto ec = co_await buf.async_advance(sizeof(UInt), region);
    if (ec) {
        co_return ec;
    }
    for (std::size_t i = 0; i < sizeof(UInt); ++i) {
        const auto shift = static_cast<unsigned>(8u * (sizeof(UInt) - 1u - i));
        region[i] = static_cast<core::byte>((v >> shift) & 0xFFu);
    }
    co_return std::error_code{};
}

template <class UInt>
asio::awaitable<std::error_code> read_be(core::CursorBuffer &buf, UInt &out) {
    static_assert(std::is_unsigned_v<UInt>);
    core::mutable_bytes_view region;
    auto ec = co_await buf.async_advance(sizeof(UInt), region);
    if (ec) {
        co_return ec;
    }
    UInt v = 0;
    for (std::size_t i = 0; i < sizeof(UInt); ++i) {
        v = static_cast<UInt>((v << 8) | static_cast<UInt>(region[i]));
    }
    out = v;
    co_return std::error_code{};
}

} // namespace

asio::awaitable<std::error_code> write_u8(core::CursorBuffer &buf, std::uint8_t v) {
    co_return co_await write_be<std::uint8_t>(buf, v);
}

asio::awaitable<std::error_code> write_u16(core::CursorBuffer &buf, std::uint16_t v) {
    co_return co_await write_be<std::uint16_t>(buf, v);
}

asio::awaitable<std::error_code> write_u32(core::CursorBuffer &buf, std::uint32_t v) {
    co_return co_await write_be<std::uint32_t>(buf, v);
}

asio::awaitable<std::error_code> write_u64(core::CursorBuffer &buf, std::uint64_t v) {
    co_return co_await write_be<std::uint64_t>(buf, v);
}

asio::awaitable<std::error_code> write_char(core::CursorBuffer &buf, char v) {
    co_return co_await write_be<std::uint8_t>(buf, static_cast<std::uint8_t>(v));
}

asio::awaitable<std::error_code> write_bytes(core::CursorBuffer &buf,
                                             core::bytes_view v) {
    core::mutable_bytes_view region;
    auto ec = co_await buf.async_advance(v.size(), region);
    if (ec) {
        co_return ec;
    }
    std::copy(v.begin(), v.end(), region.begin());
    co_return std::error_code{};
}

asio::awaitable<std::error_code> write_string(core::CursorBuffer &buf,
                                              std::string_view v) {
    co_return co_await write_bytes(
        buf, core::bytes_view{reinterpret_cast<const core::byte *>(v.data()),
                              v.size()});
}

asio::awaitable<std::error_code> read_u8(core::CursorBuffer &buf, std::uint8_t &out) {
    co_return co_await read_be<std::uint8_t>(buf, out);
}

asio::awaitable<std::error_code> read_u16(core::CursorBuffer &buf, std::uint16_t &out) {
    co_return co_await read_be<std::uint16_t>(buf, out);
}

asio::awaitable<std::error_code> read_u32(core::CursorBuffer &buf, std::uint32_t &out) {
    co_return co_await read_be<std::uint32_t>(buf, out);
}

asio::awaitable<std::error_code> read_u64(core::CursorBuffer &buf, std::uint64_t &out) {
    co_return co_await read_be<std::uint64_t>(buf, out);
}

asio::awaitable<std::error_code> read_char(core::CursorBuffer &buf, char &out) {
    std::uint8_t v = 0;
    auto ec = co_await read_be<std::uint8_t>(buf, v);
    if (ec) {
        co_return ec;
    }
    out = static_cast<char>(v);
    co_return std::error_code{};
}

asio::awaitable<std::error_code> read_bytes(core::CursorBuffer &buf,
                                            std::size_t len,
                                            std::vector<core::byte> &out) {
    core::mutable_bytes_view region;
    auto ec = co_await buf.async_advance(len, region);
    if (ec) {
        co_return ec;
    }
    out.assign(region.begin(), region.end());
    co_return std::error_code{};
}

asio::awaitable<std::error_code> read_string(core::CursorBuffer &buf,
                                             std::size_t len,
                                             std::string &out) {
    core::mutable_bytes_view region;
    auto ec = co_await buf.async_advance(len, region);
    if (ec) {
        co_return ec;
    }
    out.assign(reinterpret_cast<const char *>(region.data()), region.size());
    co_return std::error_code{};
}

} // namespace blobwire::codec
