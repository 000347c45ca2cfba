#include "blobwire/channel/stream_channel.hpp"

#include "blobwire/codec/error.hpp"
#include "blobwire/core/error.hpp"
#include "blobwire/utils/hex.hpp"

#include "../core/log_detail.hpp"

#include <asio/error.hpp>

#include <spdlog/spdlog.h>

#include <array>

namespace blobwire::channel {
namespace {

// 统一“对端关闭”的各种表现：EOF、EPIPE、ECONNRESET、0 字节。
[[nodiscard]] std::error_code translate_io_result(std::error_code ec,
                                                  std::size_t n) noexcept {
    if (ec == asio::error::eof || ec == std::errc::broken_pipe ||
        ec == std::errc::connection_reset) {
        return make_error_code(errc::unexpected_end_of_stream);
    }
    if (ec) {
        return ec;
    }
    if (n == 0) {
        return make_error_code(errc::unexpected_end_of_stream);
    }
    return {};
}

/*
 * 流式接收用的就绪钩子：
 * - window 即当前帧中尚未到达的尾部，钩子只往 window 内读，因此不会越过帧尾；
 * - 每次 read_some 尽量多读（最多到帧尾），至少读满 min_bytes 才返回；
 * - failed() 用于区分“流错误”和“payload 内容错误”。
 */
class StreamFillHook final : public core::ReadinessHook {
public:
    explicit StreamFillHook(Stream &stream) noexcept : stream_(stream) {}

    [[nodiscard]] bool failed() const noexcept { return failed_; }

    asio::awaitable<std::pair<std::error_code, std::size_t>>
    async_make_ready(core::mutable_bytes_view window,
                     std::size_t min_bytes) override {
        std::size_t filled = 0;
        while (filled < min_bytes) {
            auto [ec, n] =
                co_await stream_.async_read_some(window.subspan(filled));
            ec = translate_io_result(ec, n);
            if (ec) {
                failed_ = true;
                co_return std::pair{ec, filled};
            }
            filled += n;
        }
        co_return std::pair{std::error_code{}, filled};
    }

private:
    Stream &stream_;
    bool failed_{false};
};

} // namespace

std::array<core::byte, core::kLengthPrefixSize>
encode_length_prefix(std::uint32_t n) noexcept {
    return {
        static_cast<core::byte>((n >> 24U) & 0xFFU),
        static_cast<core::byte>((n >> 16U) & 0xFFU),
        static_cast<core::byte>((n >> 8U) & 0xFFU),
        static_cast<core::byte>(n & 0xFFU),
    };
}

std::uint32_t
decode_length_prefix(const std::array<core::byte, core::kLengthPrefixSize> &prefix) noexcept {
    return (static_cast<std::uint32_t>(prefix[0]) << 24U) |
           (static_cast<std::uint32_t>(prefix[1]) << 16U) |
           (static_cast<std::uint32_t>(prefix[2]) << 8U) |
           static_cast<std::uint32_t>(prefix[3]);
}

/*
 * 一侧（收或发）的逻辑传输占用标记：
 * - 构造时置位 in_flight，析构时清除；
 * - 持有 TransferState 的一份引用计数，通道先于本对象销毁时收尾仍然安全；
 * - 析构前未 complete() 说明传输在帧中途结束（出错、取消或协程被销毁），
 *   此时通道字节位置不可信，标记 desynchronized。
 */
class StreamChannel::TransferScope final {
public:
    TransferScope(std::shared_ptr<TransferState> state,
                  bool TransferState::*in_flight) noexcept
        : state_(std::move(state)), in_flight_(in_flight) {
        state_.get()->*in_flight_ = true;
    }

    TransferScope(const TransferScope &) = delete;
    TransferScope &operator=(const TransferScope &) = delete;

    ~TransferScope() {
        state_.get()->*in_flight_ = false;
        if (!completed_) {
            state_->desynchronized = true;
        }
    }

    void complete() noexcept { completed_ = true; }

private:
    std::shared_ptr<TransferState> state_;
    bool TransferState::*in_flight_;
    bool completed_{false};
};

StreamChannel::StreamChannel(std::unique_ptr<Stream> stream, std::string name,
                             StreamChannelOptions options)
    : stream_(std::move(stream)), name_(std::move(name)), options_(std::move(options)) {}

asio::any_io_executor StreamChannel::executor() const noexcept {
    if (!stream_) {
        return asio::any_io_executor{};
    }
    return stream_->executor();
}

bool StreamChannel::is_open() const noexcept {
    return stream_ && stream_->is_open();
}

void StreamChannel::close() noexcept {
    if (stream_) {
        stream_->cancel();
        stream_->close();
    }
}

std::error_code StreamChannel::check_usable_() const noexcept {
    if (!is_open()) {
        return make_error_code(errc::closed);
    }
    if (state_->desynchronized) {
        return make_error_code(errc::desynchronized);
    }
    return {};
}

asio::awaitable<std::error_code>
StreamChannel::receive_exact_(core::mutable_bytes_view dst) {
    // 部分读取不丢弃：从当前填充位置继续读，直到恰好 dst.size() 字节。
    std::size_t offset = 0;
    while (offset < dst.size()) {
        auto [ec, n] = co_await stream_->async_read_some(dst.subspan(offset));
        ec = translate_io_result(ec, n);
        if (ec) {
            co_return ec;
        }
        offset += n;
    }
    co_return std::error_code{};
}

asio::awaitable<std::error_code>
StreamChannel::send_exact_(core::bytes_view src) {
    std::size_t offset = 0;
    while (offset < src.size()) {
        auto [ec, n] = co_await stream_->async_write_some(src.subspan(offset));
        ec = translate_io_result(ec, n);
        if (ec) {
            co_return ec;
        }
        offset += n;
    }
    co_return std::error_code{};
}

asio::awaitable<std::pair<std::error_code, std::uint32_t>>
StreamChannel::receive_length_prefix_() {
    std::array<core::byte, core::kLengthPrefixSize> len_buf{};
    auto ec = co_await receive_exact_(
        core::mutable_bytes_view{len_buf.data(), len_buf.size()});
    if (ec) {
        co_return std::pair{ec, std::uint32_t{0}};
    }
    co_return std::pair{std::error_code{}, decode_length_prefix(len_buf)};
}

asio::awaitable<std::error_code>
StreamChannel::send_length_prefix_(std::uint32_t n) {
    const auto len_buf = encode_length_prefix(n);
    co_return co_await send_exact_(
        core::bytes_view{len_buf.data(), len_buf.size()});
}

asio::awaitable<std::error_code>
StreamChannel::async_receive_exact(core::mutable_bytes_view dst) {
    if (auto ec = check_usable_()) {
        co_return ec;
    }
    if (state_->receiving) {
        co_return make_error_code(errc::transfer_in_progress);
    }
    TransferScope scope(state_, &TransferState::receiving);

    auto ec = co_await receive_exact_(dst);
    if (!ec) {
        scope.complete();
    }
    co_return ec;
}

asio::awaitable<std::error_code>
StreamChannel::async_send_exact(core::bytes_view src) {
    if (auto ec = check_usable_()) {
        co_return ec;
    }
    if (state_->sending) {
        co_return make_error_code(errc::transfer_in_progress);
    }
    TransferScope scope(state_, &TransferState::sending);

    auto ec = co_await send_exact_(src);
    if (!ec) {
        scope.complete();
    }
    co_return ec;
}

asio::awaitable<std::pair<std::error_code, std::uint32_t>>
StreamChannel::async_receive_length_prefix() {
    if (auto ec = check_usable_()) {
        co_return std::pair{ec, std::uint32_t{0}};
    }
    if (state_->receiving) {
        co_return std::pair{make_error_code(errc::transfer_in_progress),
                            std::uint32_t{0}};
    }
    TransferScope scope(state_, &TransferState::receiving);

    auto result = co_await receive_length_prefix_();
    if (!result.first) {
        scope.complete();
    }
    co_return result;
}

asio::awaitable<std::error_code>
StreamChannel::async_send_length_prefix(std::uint32_t n) {
    if (auto ec = check_usable_()) {
        co_return ec;
    }
    if (state_->sending) {
        co_return make_error_code(errc::transfer_in_progress);
    }
    TransferScope scope(state_, &TransferState::sending);

    auto ec = co_await send_length_prefix_(n);
    if (!ec) {
        scope.complete();
    }
    co_return ec;
}

asio::awaitable<std::pair<std::error_code, std::vector<core::byte>>>
StreamChannel::async_receive_frame() {
    if (auto ec = check_usable_()) {
        co_return std::pair{ec, std::vector<core::byte>{}};
    }
    if (state_->receiving) {
        co_return std::pair{make_error_code(errc::transfer_in_progress),
                            std::vector<core::byte>{}};
    }
    TransferScope scope(state_, &TransferState::receiving);

    auto [ec, len] = co_await receive_length_prefix_();
    if (ec) {
        co_return std::pair{ec, std::vector<core::byte>{}};
    }
    if (len > options_.max_frame_size) {
        co_return std::pair{make_error_code(errc::frame_too_large),
                            std::vector<core::byte>{}};
    }

    std::vector<core::byte> payload(len);
    ec = co_await receive_exact_(
        core::mutable_bytes_view{payload.data(), payload.size()});
    if (ec) {
        co_return std::pair{ec, std::vector<core::byte>{}};
    }

    trace_frame_("received", payload.size());
    scope.complete();
    co_return std::pair{std::error_code{}, std::move(payload)};
}

asio::awaitable<std::error_code>
StreamChannel::async_send_frame(core::bytes_view payload) {
    if (auto ec = check_usable_()) {
        co_return ec;
    }
    if (state_->sending) {
        co_return make_error_code(errc::transfer_in_progress);
    }
    TransferScope scope(state_, &TransferState::sending);

    if (payload.size() > options_.max_frame_size) {
        scope.complete();
        co_return make_error_code(errc::frame_too_large);
    }

    auto ec = co_await send_length_prefix_(
        static_cast<std::uint32_t>(payload.size()));
    if (ec) {
        co_return ec;
    }
    ec = co_await send_exact_(payload);
    if (ec) {
        co_return ec;
    }

    trace_frame_("sent", payload.size());
    scope.complete();
    co_return std::error_code{};
}

asio::awaitable<std::error_code>
StreamChannel::async_receive_with(const DecodeFn &decode) {
    if (auto ec = check_usable_()) {
        co_return ec;
    }
    if (state_->receiving) {
        co_return make_error_code(errc::transfer_in_progress);
    }
    TransferScope scope(state_, &TransferState::receiving);

    auto [ec, len] = co_await receive_length_prefix_();
    if (ec) {
        co_return ec;
    }
    if (len > options_.max_frame_size) {
        co_return make_error_code(errc::frame_too_large);
    }

    StreamFillHook hook(*stream_);
    core::CursorBuffer buf(len, &hook);

    ec = co_await decode(buf);
    if (!ec && !buf.exhausted()) {
        ec = codec::make_error_code(codec::errc::size_mismatch);
    }
    if (!ec) {
        trace_frame_("received", len);
        scope.complete();
        co_return std::error_code{};
    }

    if (hook.failed()) {
        // 流本身出错：帧被截断，不再尝试读取剩余字节。
        co_return ec;
    }

    // payload 内容错误：读完并丢弃本帧剩余字节，使下一帧从正确位置开始。
    const auto drain_ec = co_await buf.async_make_all_ready();
    report_decode_failure_(buf, ec);
    if (!drain_ec) {
        scope.complete();
    }
    co_return ec;
}

asio::awaitable<std::error_code>
StreamChannel::async_send_with(std::size_t payload_size, const EncodeFn &encode) {
    if (auto ec = check_usable_()) {
        co_return ec;
    }
    if (state_->sending) {
        co_return make_error_code(errc::transfer_in_progress);
    }
    TransferScope scope(state_, &TransferState::sending);

    // 以下错误都发生在写出第一个字节之前，通道保持同步。
    if (payload_size > options_.max_frame_size) {
        scope.complete();
        co_return make_error_code(errc::frame_too_large);
    }

    core::CursorBuffer buf(payload_size);
    auto ec = co_await encode(buf);
    if (!ec && !buf.exhausted()) {
        ec = codec::make_error_code(codec::errc::size_mismatch);
    }
    if (ec) {
        core::detail::resolve_logger(options_.diagnostics)
            ->error("[{}] encode failed: [{}] {} (offset={} len={})", name_,
                    ec.category().name(), ec.message(), buf.offset(),
                    buf.capacity());
        scope.complete();
        co_return ec;
    }

    ec = co_await send_length_prefix_(static_cast<std::uint32_t>(payload_size));
    if (ec) {
        co_return ec;
    }
    ec = co_await send_exact_(buf.contents());
    if (ec) {
        co_return ec;
    }

    trace_frame_("sent", payload_size);
    scope.complete();
    co_return std::error_code{};
}

void StreamChannel::report_decode_failure_(const core::CursorBuffer &buf,
                                           std::error_code ec) const {
    auto logger = core::detail::resolve_logger(options_.diagnostics);
    logger->error("[{}] decode failed: [{}] {} (offset={} len={})", name_,
                  ec.category().name(), ec.message(), buf.offset(),
                  buf.capacity());
    if (options_.diagnostics.dump_on_decode_error) {
        logger->error("[{}] buffer under inspection:\n{}", name_,
                      utils::describe_buffer(buf));
    }
}

void StreamChannel::trace_frame_(const char *direction, std::size_t len) const {
    if (!options_.diagnostics.trace_transfers) {
        return;
    }
    core::detail::resolve_logger(options_.diagnostics)
        ->trace("[{}] {} frame len={}", name_, direction, len);
}

} // namespace blobwire::channel
