#pragma once

#include "blobwire/channel/stream_channel.hpp"
#include "blobwire/codec/capability.hpp"
#include "blobwire/core/cursor_buffer.hpp"

#include <asio/awaitable.hpp>

#include <system_error>
#include <utility>

namespace blobwire::channel {

/**
 * @brief 把一个 Codec 绑定到 StreamChannel：收/发“一个 B::value_type”。
 *
 * 说明：
 * - 分帧长度取自 B::size_of；写出/读入的字节数必须与之恰好相等，
 *   否则返回 codec::errc::size_mismatch（发送侧此时不写出任何字节）；
 * - 接收为流式解码：帧 payload 按需从流中拉取，不要求整帧先到齐；
 * - 多个 MessageChannel（例如请求类型与响应类型）可以共享同一个 StreamChannel，
 *   同侧并发仍受 StreamChannel 的单一在途传输约束。
 */
template <codec::Codec B>
class MessageChannel final {
public:
    using codec_type = B;
    using value_type = typename B::value_type;

    explicit MessageChannel(StreamChannel &channel) noexcept
        : channel_(channel) {}

    [[nodiscard]] StreamChannel &channel() const noexcept { return channel_; }

    // 失败时返回默认构造的 value_type，不返回部分解码的值。
    asio::awaitable<std::pair<std::error_code, value_type>> async_receive() {
        value_type value{};
        auto ec = co_await channel_.async_receive_with(
            [&value](core::CursorBuffer &buf) { return B::read(buf, value); });
        if (ec) {
            co_return std::pair{ec, value_type{}};
        }
        co_return std::pair{std::error_code{}, std::move(value)};
    }

    asio::awaitable<std::error_code> async_send(const value_type &value) {
        co_return co_await channel_.async_send_with(
            B::size_of(value),
            [&value](core::CursorBuffer &buf) { return B::write(buf, value); });
    }

private:
    StreamChannel &channel_;
};

} // namespace blobwire::channel
