#include "blobwire/channel/stream.hpp"

#include <asio/as_tuple.hpp>
#include <asio/buffer.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/use_awaitable.hpp>

namespace blobwire::channel {
namespace {

// 任意 asio 流式 socket 的适配（tcp / local）。
template <class Socket>
class SocketStream final : public Stream {
public:
    explicit SocketStream(Socket socket)
        : executor_(socket.get_executor()), socket_(std::move(socket)) {}

    [[nodiscard]] asio::any_io_executor executor() const noexcept override {
        return executor_;
    }
    [[nodiscard]] bool is_open() const noexcept override {
        return socket_.is_open();
    }

    void cancel() noexcept override {
        std::error_code ignored;
        socket_.cancel(ignored);
    }

    void close() noexcept override {
        std::error_code ignored;
        socket_.close(ignored);
    }

    asio::awaitable<std::pair<std::error_code, std::size_t>>
    async_read_some(core::mutable_bytes_view dst) override {
        auto [ec, n] = co_await socket_.async_read_some(
            asio::buffer(dst.data(), dst.size()),
            asio::as_tuple(asio::use_awaitable));
        co_return std::pair{ec, n};
    }

    asio::awaitable<std::pair<std::error_code, std::size_t>>
    async_write_some(core::bytes_view src) override {
        auto [ec, n] = co_await socket_.async_write_some(
            asio::buffer(src.data(), src.size()),
            asio::as_tuple(asio::use_awaitable));
        co_return std::pair{ec, n};
    }

private:
    asio::any_io_executor executor_;
    Socket socket_;
};

// 管道：读写分别走两个 fd（例如 stdin/stdout）。
class PipeStream final : public Stream {
public:
    PipeStream(asio::any_io_executor ex, int read_fd, int write_fd)
        : executor_(ex), in_(ex, read_fd), out_(ex, write_fd) {
        std::error_code ignored;
        in_.non_blocking(true, ignored);
        out_.non_blocking(true, ignored);
    }

    [[nodiscard]] asio::any_io_executor executor() const noexcept override {
        return executor_;
    }
    [[nodiscard]] bool is_open() const noexcept override {
        return in_.is_open() && out_.is_open();
    }

    void cancel() noexcept override {
        std::error_code ignored;
        in_.cancel(ignored);
        out_.cancel(ignored);
    }

    void close() noexcept override {
        std::error_code ignored;
        in_.close(ignored);
        out_.close(ignored);
    }

    asio::awaitable<std::pair<std::error_code, std::size_t>>
    async_read_some(core::mutable_bytes_view dst) override {
        auto [ec, n] = co_await in_.async_read_some(
            asio::buffer(dst.data(), dst.size()),
            asio::as_tuple(asio::use_awaitable));
        co_return std::pair{ec, n};
    }

    asio::awaitable<std::pair<std::error_code, std::size_t>>
    async_write_some(core::bytes_view src) override {
        auto [ec, n] = co_await out_.async_write_some(
            asio::buffer(src.data(), src.size()),
            asio::as_tuple(asio::use_awaitable));
        co_return std::pair{ec, n};
    }

private:
    asio::any_io_executor executor_;
    asio::posix::stream_descriptor in_;
    asio::posix::stream_descriptor out_;
};

} // namespace

std::unique_ptr<Stream> make_tcp_stream(asio::ip::tcp::socket socket) {
    return std::make_unique<SocketStream<asio::ip::tcp::socket>>(
        std::move(socket));
}

std::unique_ptr<Stream>
make_local_stream(asio::local::stream_protocol::socket socket) {
    return std::make_unique<SocketStream<asio::local::stream_protocol::socket>>(
        std::move(socket));
}

std::unique_ptr<Stream> make_pipe_stream(asio::any_io_executor ex, int read_fd,
                                         int write_fd) {
    return std::make_unique<PipeStream>(ex, read_fd, write_fd);
}

} // namespace blobwire::channel
