/**
 * @file pipe_roundtrip.cpp
 * @brief 管道往返示例：在同一进程内用两对 pipe() 连接两个 StreamChannel，
 *        以 MessageChannel 发送一个“目录清单”并校验对端收到的值。
 *
 * 用法：
 *   ./pipe_roundtrip [--trace]
 *
 * 说明：
 * - 清单类型为 SequenceOf<Pair<String, Optional<Decimal<uint64>>>>：
 *   每项是“名字 + 可选的大小”，目录没有大小；
 * - 先用 async_encode 打印完整的线上字节（含 4 字节长度前缀），再真正经管道收发；
 * - --trace 打开每帧的 trace 日志（输出到 stderr）。
 */

#include "blobwire/channel/message_channel.hpp"
#include "blobwire/channel/stream.hpp"
#include "blobwire/channel/stream_channel.hpp"
#include "blobwire/codec/capability.hpp"
#include "blobwire/codec/combinators.hpp"
#include "blobwire/codec/scalar.hpp"
#include "blobwire/core/log.hpp"
#include "blobwire/utils/hex.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <signal.h>
#include <unistd.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string_view>
#include <vector>

namespace {

using namespace blobwire;

using ListingEntry =
    codec::Pair<codec::String, codec::Optional<codec::Decimal<std::uint64_t>>>;
using Listing = codec::SequenceOf<ListingEntry>;

Listing::value_type make_listing() {
    return {
        {"README.md", 1832u},
        {"src", std::nullopt},
        {"src/main.cpp", 20480u},
        {"empty.txt", 0u},
    };
}

asio::awaitable<void> print_frame(const Listing::value_type &listing) {
    auto [ec, payload] = co_await codec::async_encode<Listing>(listing);
    if (ec) {
        std::cerr << "encode failed: " << ec.message() << "\n";
        co_return;
    }

    const auto prefix =
        channel::encode_length_prefix(static_cast<std::uint32_t>(payload.size()));
    std::vector<core::byte> frame(prefix.begin(), prefix.end());
    frame.insert(frame.end(), payload.begin(), payload.end());

    std::cout << "value: " << Listing::pretty(listing) << "\n";
    std::cout << "frame (" << frame.size() << " bytes):\n"
              << utils::hex_dump(core::bytes_view{frame.data(), frame.size()});
}

} // namespace

int main(int argc, char **argv) {
    ::signal(SIGPIPE, SIG_IGN);

    channel::StreamChannelOptions options;
    if (argc > 1 && std::string_view(argv[1]) == "--trace") {
        core::set_log_level(core::LogLevel::trace);
        options.diagnostics.trace_transfers = true;
    }

    int a_to_b[2] = {-1, -1};
    int b_to_a[2] = {-1, -1};
    if (::pipe(a_to_b) != 0 || ::pipe(b_to_a) != 0) {
        std::cerr << "pipe() failed\n";
        return 2;
    }

    asio::io_context ioc;
    channel::StreamChannel sender(
        channel::make_pipe_stream(ioc.get_executor(), b_to_a[0], a_to_b[1]),
        "sender", options);
    channel::StreamChannel receiver(
        channel::make_pipe_stream(ioc.get_executor(), a_to_b[0], b_to_a[1]),
        "receiver", options);

    channel::MessageChannel<Listing> out(sender);
    channel::MessageChannel<Listing> in(receiver);

    const auto listing = make_listing();
    int exit_code = 1;

    asio::co_spawn(
        ioc,
        [&]() -> asio::awaitable<void> {
            co_await print_frame(listing);

            auto ec = co_await out.async_send(listing);
            if (ec) {
                std::cerr << "send failed: " << ec.message() << "\n";
                co_return;
            }

            auto [rec, got] = co_await in.async_receive();
            if (rec) {
                std::cerr << "receive failed: " << rec.message() << "\n";
                co_return;
            }
            if (got != listing) {
                std::cerr << "received value differs\n";
                co_return;
            }
            std::cout << "received: " << Listing::pretty(got) << "\n";
            exit_code = 0;
        },
        asio::detached);

    ioc.run();
    sender.close();
    receiver.close();
    return exit_code;
}
