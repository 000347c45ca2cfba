#pragma once

#include "blobwire/channel/error.hpp"
#include "blobwire/channel/stream.hpp"
#include "blobwire/core/common.hpp"
#include "blobwire/core/cursor_buffer.hpp"
#include "blobwire/core/log.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace blobwire::channel {

// 长度前缀的线上形式（4 字节大端），供需要自行拼帧或解析帧的调用方使用。
[[nodiscard]] std::array<core::byte, core::kLengthPrefixSize>
encode_length_prefix(std::uint32_t n) noexcept;
[[nodiscard]] std::uint32_t
decode_length_prefix(const std::array<core::byte, core::kLengthPrefixSize> &prefix) noexcept;

struct StreamChannelOptions final {
    // 单帧 payload 上限（收发两侧都检查）。
    std::uint32_t max_frame_size{core::kDefaultMaxFrameSize};

    core::DiagnosticOptions diagnostics{};
};

/**
 * @brief 命名的双向字节流通道：保证“完整”收发，并提供 4 字节大端长度前缀分帧。
 *
 * 帧格式：[u32 BE 长度 L][L 字节 payload]。
 *
 * 并发约束（单执行器 / 协程语境）：
 * - 收、发两侧各自同一时刻最多一个逻辑传输；第二个同侧调用直接返回
 *   errc::transfer_in_progress，不排队；两侧之间互不影响。
 * - 逻辑传输在帧中途失败（流错误、取消、协程被销毁）后，通道字节位置不可信，
 *   之后的调用一律返回 errc::desynchronized，调用方应关闭并重建底层流。
 * - 解码失败（payload 内容不合法）时会把本帧剩余字节读完丢弃，
 *   若丢弃成功则通道保持可用，只有当前消息失败。
 *
 * 生命周期：
 * - 通道（连同它持有的 Stream）必须比经它发起、仍在进行中的传输活得久；
 *   销毁通道前应先 close() 并等待传输返回。
 * - 例外：挂起中的传输协程若在通道销毁之后才被销毁（例如随 io_context 析构），
 *   其收尾只触及与通道共享的占用状态，不会访问已销毁的通道。
 */
class StreamChannel final {
public:
    using DecodeFn =
        std::function<asio::awaitable<std::error_code>(core::CursorBuffer &)>;
    using EncodeFn =
        std::function<asio::awaitable<std::error_code>(core::CursorBuffer &)>;

    StreamChannel(std::unique_ptr<Stream> stream, std::string name,
                  StreamChannelOptions options = {});

    StreamChannel(const StreamChannel &) = delete;
    StreamChannel &operator=(const StreamChannel &) = delete;

    [[nodiscard]] const std::string &name() const noexcept { return name_; }
    [[nodiscard]] const StreamChannelOptions &options() const noexcept {
        return options_;
    }
    [[nodiscard]] asio::any_io_executor executor() const noexcept;
    [[nodiscard]] bool is_open() const noexcept;
    [[nodiscard]] bool desynchronized() const noexcept {
        return state_->desynchronized;
    }

    void close() noexcept;

    // 每个调用都是一次独立的逻辑传输，占用对应一侧直到完成。
    asio::awaitable<std::error_code>
    async_receive_exact(core::mutable_bytes_view dst);
    asio::awaitable<std::error_code> async_send_exact(core::bytes_view src);

    asio::awaitable<std::pair<std::error_code, std::uint32_t>>
    async_receive_length_prefix();
    asio::awaitable<std::error_code> async_send_length_prefix(std::uint32_t n);

    // 整帧收发（payload 一次性读入内存）。
    asio::awaitable<std::pair<std::error_code, std::vector<core::byte>>>
    async_receive_frame();
    asio::awaitable<std::error_code> async_send_frame(core::bytes_view payload);

    /**
     * @brief 流式收一帧：按长度前缀创建恰好 L 字节的 CursorBuffer，
     * 其就绪钩子按需从流中拉取字节（不会越过帧尾），再交给 decode。
     *
     * decode 结束后游标必须恰好停在 L，否则返回 codec::errc::size_mismatch。
     */
    asio::awaitable<std::error_code> async_receive_with(const DecodeFn &decode);

    /**
     * @brief 发一帧：先把 payload 完整编码进容量为 payload_size 的缓冲区，
     * 校验写满后再依次发送长度前缀与 payload。
     *
     * 编码失败或写出字节数与 payload_size 不一致时不发送任何字节。
     */
    asio::awaitable<std::error_code> async_send_with(std::size_t payload_size,
                                                     const EncodeFn &encode);

private:
    // 收、发两侧的占用标记与失步标记；由通道和进行中的传输共同持有。
    struct TransferState final {
        bool receiving{false};
        bool sending{false};
        bool desynchronized{false};
    };

    class TransferScope;

    [[nodiscard]] std::error_code check_usable_() const noexcept;

    asio::awaitable<std::error_code>
    receive_exact_(core::mutable_bytes_view dst);
    asio::awaitable<std::error_code> send_exact_(core::bytes_view src);
    asio::awaitable<std::pair<std::error_code, std::uint32_t>>
    receive_length_prefix_();
    asio::awaitable<std::error_code> send_length_prefix_(std::uint32_t n);

    void report_decode_failure_(const core::CursorBuffer &buf,
                                std::error_code ec) const;
    void trace_frame_(const char *direction, std::size_t len) const;

    std::unique_ptr<Stream> stream_;
    std::string name_;
    StreamChannelOptions options_{};

    std::shared_ptr<TransferState> state_{std::make_shared<TransferState>()};
};

} // namespace blobwire::channel
