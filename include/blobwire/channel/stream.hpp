#pragma once

#include "blobwire/core/common.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/local/stream_protocol.hpp>

#include <cstddef>
#include <memory>
#include <system_error>
#include <utility>

namespace blobwire::channel {

/**
 * @brief 双向字节流抽象（socket / pipe / 纯内存）。
 *
 * 说明：
 * - StreamChannel 只依赖 read_some/write_some/cancel/close 语义，
 *   不关心底层是 TCP、Unix socket、管道还是内存队列；
 * - read_some/write_some 允许“部分完成”：返回的 n 可以小于请求长度，
 *   补齐由 StreamChannel 负责；
 * - 对端关闭时 read_some 返回 EOF 错误或 n == 0，两者等价。
 */
class Stream {
public:
    virtual ~Stream() = default;

    [[nodiscard]] virtual asio::any_io_executor executor() const noexcept = 0;
    [[nodiscard]] virtual bool is_open() const noexcept = 0;

    virtual void cancel() noexcept = 0;
    virtual void close() noexcept = 0;

    virtual asio::awaitable<std::pair<std::error_code, std::size_t>>
    async_read_some(core::mutable_bytes_view dst) = 0;

    virtual asio::awaitable<std::pair<std::error_code, std::size_t>>
    async_write_some(core::bytes_view src) = 0;
};

[[nodiscard]] std::unique_ptr<Stream>
make_tcp_stream(asio::ip::tcp::socket socket);

[[nodiscard]] std::unique_ptr<Stream>
make_local_stream(asio::local::stream_protocol::socket socket);

/**
 * @brief 用一对文件描述符（读端、写端）构造管道流，接管两个 fd 的所有权。
 *
 * 典型用法：stdin/stdout，或 pipe() 得到的两端分别交给两个进程/协程。
 * 注意：写端对端关闭时内核可能发送 SIGPIPE，进程应自行忽略该信号。
 */
[[nodiscard]] std::unique_ptr<Stream>
make_pipe_stream(asio::any_io_executor ex, int read_fd, int write_fd);

} // namespace blobwire::channel
