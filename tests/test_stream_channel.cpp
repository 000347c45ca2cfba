#include "blobwire/channel/error.hpp"
#include "blobwire/channel/stream_channel.hpp"
#include "blobwire/codec/error.hpp"
#include "blobwire/codec/primitive.hpp"
#include "blobwire/core/error.hpp"
#include "blobwire/utils/hex.hpp"

#include "memory_stream.hpp"
#include "test_main.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace {

using namespace blobwire;
using blobwire::channel::StreamChannel;
using blobwire::channel::StreamChannelOptions;
using blobwire::channel::errc;
using blobwire::core::byte;
using blobwire::core::bytes_view;
using blobwire::core::mutable_bytes_view;
using blobwire::tests::MemoryStreamOptions;
using blobwire::tests::inject;
using blobwire::tests::make_memory_duplex;

std::vector<byte> hex(std::string_view text) {
  std::vector<byte> out;
  TEST_EXPECT_OK(utils::parse_hex(text, out));
  return out;
}

bytes_view view_of(const std::vector<byte>& v) { return bytes_view{v.data(), v.size()}; }

// 让出一次执行权，使同一 io_context 上的其它协程推进。
asio::awaitable<void> yield_once() {
  co_await asio::post(co_await asio::this_coro::executor, asio::use_awaitable);
}

void test_exact_transfer_with_one_byte_chunks() {
  asio::io_context ioc;
  MemoryStreamOptions slow;
  slow.max_read_chunk = 1;
  slow.max_write_chunk = 1;
  auto duplex = make_memory_duplex(ioc.get_executor(), slow, slow);
  StreamChannel client(std::move(duplex.client_stream), "client");
  StreamChannel server(std::move(duplex.server_stream), "server");

  const auto payload = hex("00 01 02 03 04 05 06 07 08 09");
  bool sent = false;
  bool received = false;

  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      TEST_EXPECT_OK(co_await client.async_send_exact(view_of(payload)));
      sent = true;
    },
    asio::detached);

  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      std::vector<byte> got(payload.size());
      TEST_EXPECT_OK(co_await server.async_receive_exact(mutable_bytes_view{got.data(), got.size()}));
      TEST_EXPECT(got == payload);
      received = true;
    },
    asio::detached);

  ioc.run();
  TEST_EXPECT(sent);
  TEST_EXPECT(received);
  TEST_EXPECT_EQ(duplex.client_to_server->total_written, payload.size());
  TEST_EXPECT(!client.desynchronized());
  TEST_EXPECT(!server.desynchronized());
}

void test_length_prefix_is_big_endian() {
  asio::io_context ioc;
  auto duplex = make_memory_duplex(ioc.get_executor());
  StreamChannel client(std::move(duplex.client_stream), "client");
  StreamChannel server(std::move(duplex.server_stream), "server");

  bool done = false;
  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      TEST_EXPECT_OK(co_await client.async_send_length_prefix(0x01020304u));
      std::vector<byte> raw(4);
      TEST_EXPECT_OK(co_await server.async_receive_exact(mutable_bytes_view{raw.data(), raw.size()}));
      TEST_EXPECT_BYTES(raw, hex("01020304"));

      TEST_EXPECT_OK(co_await client.async_send_length_prefix(0));
      auto [ec, n] = co_await server.async_receive_length_prefix();
      TEST_EXPECT_OK(ec);
      TEST_EXPECT_EQ(n, 0u);
      done = true;
    },
    asio::detached);
  ioc.run();
  TEST_EXPECT(done);
}

void test_length_prefix_helpers_match_wire() {
  const auto prefix = channel::encode_length_prefix(0x01020304u);
  TEST_EXPECT_BYTES(prefix, hex("01020304"));
  TEST_EXPECT_EQ(channel::decode_length_prefix(prefix), 0x01020304u);
  TEST_EXPECT_EQ(channel::decode_length_prefix(channel::encode_length_prefix(0xFFFFFFFFu)),
                 0xFFFFFFFFu);
  TEST_EXPECT_BYTES(channel::encode_length_prefix(0), hex("00000000"));

  // 用 encode_length_prefix 自行拼出的帧与通道实际写出的字节一致。
  asio::io_context ioc;
  auto duplex = make_memory_duplex(ioc.get_executor());
  StreamChannel client(std::move(duplex.client_stream), "client");
  const auto payload = hex("aa bb cc");
  bool done = false;
  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      TEST_EXPECT_OK(co_await client.async_send_frame(view_of(payload)));
      done = true;
    },
    asio::detached);
  ioc.run();
  TEST_EXPECT(done);

  const auto len = channel::encode_length_prefix(static_cast<std::uint32_t>(payload.size()));
  std::vector<byte> expected(len.begin(), len.end());
  expected.insert(expected.end(), payload.begin(), payload.end());
  const auto& wire = duplex.client_to_server->buf;
  TEST_EXPECT_BYTES(std::vector<byte>(wire.begin(), wire.end()), expected);
}

void test_frame_roundtrip() {
  asio::io_context ioc;
  MemoryStreamOptions chunky;
  chunky.max_read_chunk = 3;
  auto duplex = make_memory_duplex(ioc.get_executor(), {}, chunky);
  StreamChannel client(std::move(duplex.client_stream), "client");
  StreamChannel server(std::move(duplex.server_stream), "server");

  const auto payload = hex("de ad be ef 00 11");
  bool done = false;
  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      TEST_EXPECT_OK(co_await client.async_send_frame(view_of(payload)));
      TEST_EXPECT_OK(co_await client.async_send_frame(bytes_view{}));

      auto [ec, got] = co_await server.async_receive_frame();
      TEST_EXPECT_OK(ec);
      TEST_EXPECT(got == payload);

      auto [ec2, empty] = co_await server.async_receive_frame();
      TEST_EXPECT_OK(ec2);
      TEST_EXPECT(empty.empty());
      done = true;
    },
    asio::detached);
  ioc.run();
  TEST_EXPECT(done);
  TEST_EXPECT_EQ(duplex.client_to_server->total_written, 4u + payload.size() + 4u);
}

void test_disconnect_mid_transfer() {
  asio::io_context ioc;
  auto duplex = make_memory_duplex(ioc.get_executor());
  StreamChannel server(std::move(duplex.server_stream), "server");

  // 只到达 3 字节，随后对端关闭。
  const auto partial = hex("aa bb cc");
  inject(*duplex.client_to_server, view_of(partial));
  duplex.client_to_server->closed = true;

  bool done = false;
  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      std::vector<byte> got(8);
      auto ec = co_await server.async_receive_exact(mutable_bytes_view{got.data(), got.size()});
      TEST_EXPECT_ERROR(ec, errc::unexpected_end_of_stream);
      TEST_EXPECT(server.desynchronized());

      ec = co_await server.async_receive_exact(mutable_bytes_view{got.data(), 1});
      TEST_EXPECT_ERROR(ec, errc::desynchronized);
      done = true;
    },
    asio::detached);
  ioc.run();
  TEST_EXPECT(done);
}

void test_truncated_frame() {
  asio::io_context ioc;
  auto duplex = make_memory_duplex(ioc.get_executor());
  StreamChannel server(std::move(duplex.server_stream), "server");

  inject(*duplex.client_to_server, view_of(hex("00000010 0102")));
  duplex.client_to_server->closed = true;

  bool done = false;
  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      auto [ec, got] = co_await server.async_receive_frame();
      TEST_EXPECT_ERROR(ec, errc::unexpected_end_of_stream);
      TEST_EXPECT(got.empty());
      done = true;
    },
    asio::detached);
  ioc.run();
  TEST_EXPECT(done);
}

void test_zero_byte_write_is_end_of_stream() {
  asio::io_context ioc;
  MemoryStreamOptions dead;
  dead.zero_write = true;
  auto duplex = make_memory_duplex(ioc.get_executor(), dead, {});
  StreamChannel client(std::move(duplex.client_stream), "client");

  bool done = false;
  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      const auto payload = hex("01");
      auto ec = co_await client.async_send_exact(view_of(payload));
      TEST_EXPECT_ERROR(ec, errc::unexpected_end_of_stream);
      TEST_EXPECT(client.desynchronized());
      done = true;
    },
    asio::detached);
  ioc.run();
  TEST_EXPECT(done);
}

void test_same_side_transfer_rejected() {
  asio::io_context ioc;
  auto duplex = make_memory_duplex(ioc.get_executor());
  StreamChannel client(std::move(duplex.client_stream), "client");
  StreamChannel server(std::move(duplex.server_stream), "server");

  bool first_done = false;
  bool second_done = false;
  bool send_done = false;

  // 第一个接收挂起等待数据。
  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      auto [ec, got] = co_await server.async_receive_frame();
      TEST_EXPECT_OK(ec);
      TEST_EXPECT_BYTES(got, hex("7f"));
      first_done = true;
    },
    asio::detached);

  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      co_await yield_once();
      // 同侧第二个接收：直接拒绝，不影响第一个。
      auto [ec, got] = co_await server.async_receive_frame();
      TEST_EXPECT_ERROR(ec, errc::transfer_in_progress);
      TEST_EXPECT(got.empty());
      // 另一侧不受影响。
      const auto payload = hex("7f");
      TEST_EXPECT_OK(co_await server.async_send_frame(view_of(payload)));
      second_done = true;

      TEST_EXPECT_OK(co_await client.async_send_frame(view_of(payload)));
      auto [ec2, echoed] = co_await client.async_receive_frame();
      TEST_EXPECT_OK(ec2);
      TEST_EXPECT(echoed == payload);
      send_done = true;
    },
    asio::detached);

  ioc.run();
  TEST_EXPECT(first_done);
  TEST_EXPECT(second_done);
  TEST_EXPECT(send_done);
  TEST_EXPECT(!server.desynchronized());
}

void test_frame_too_large() {
  asio::io_context ioc;
  auto duplex = make_memory_duplex(ioc.get_executor());
  StreamChannelOptions options;
  options.max_frame_size = 4;
  StreamChannel client(std::move(duplex.client_stream), "client", options);
  StreamChannel server(std::move(duplex.server_stream), "server", options);

  bool done = false;
  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      const auto big = hex("0102030405");
      auto ec = co_await client.async_send_frame(view_of(big));
      TEST_EXPECT_ERROR(ec, errc::frame_too_large);
      TEST_EXPECT(!client.desynchronized());
      TEST_EXPECT_EQ(duplex.client_to_server->total_written, 0u);

      inject(*duplex.client_to_server, view_of(hex("00000005 0102030405")));
      auto [ec2, got] = co_await server.async_receive_frame();
      TEST_EXPECT_ERROR(ec2, errc::frame_too_large);
      TEST_EXPECT(got.empty());
      done = true;
    },
    asio::detached);
  ioc.run();
  TEST_EXPECT(done);
}

void test_closed_channel() {
  asio::io_context ioc;
  auto duplex = make_memory_duplex(ioc.get_executor());
  StreamChannel client(std::move(duplex.client_stream), "client");
  StreamChannel server(std::move(duplex.server_stream), "server");

  client.close();
  TEST_EXPECT(!client.is_open());
  TEST_EXPECT(server.is_open());

  bool done = false;
  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      const auto payload = hex("01");
      TEST_EXPECT_ERROR(co_await client.async_send_frame(view_of(payload)), errc::closed);

      // 对端关闭后，接收方在帧边界处得到 unexpected_end_of_stream。
      auto [ec, got] = co_await server.async_receive_frame();
      TEST_EXPECT_ERROR(ec, errc::unexpected_end_of_stream);
      done = true;
    },
    asio::detached);
  ioc.run();
  TEST_EXPECT(done);
}

void test_cancel_desynchronizes() {
  asio::io_context ioc;
  auto duplex = make_memory_duplex(ioc.get_executor());
  StreamChannel server(std::move(duplex.server_stream), "server");

  // 帧头已到、payload 只到一半时取消。
  inject(*duplex.client_to_server, view_of(hex("00000004 0102")));

  bool receive_done = false;
  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      auto [ec, got] = co_await server.async_receive_frame();
      TEST_EXPECT(static_cast<bool>(ec));
      TEST_EXPECT(ec == asio::error::operation_aborted);
      receive_done = true;
    },
    asio::detached);

  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      co_await yield_once();
      co_await yield_once();
      server.close();
    },
    asio::detached);

  ioc.run();
  TEST_EXPECT(receive_done);
  TEST_EXPECT(server.desynchronized());
}

void test_receive_with_size_mismatch_drains_frame() {
  asio::io_context ioc;
  auto duplex = make_memory_duplex(ioc.get_executor());
  StreamChannelOptions options;
  options.diagnostics.dump_on_decode_error = false;
  StreamChannel server(std::move(duplex.server_stream), "server", options);

  // 第一帧 3 字节，但解码只消费 1 字节；第二帧应照常收到。
  inject(*duplex.client_to_server, view_of(hex("00000003 010203 00000001 09")));

  bool done = false;
  asio::co_spawn(
    ioc,
    [&]() -> asio::awaitable<void> {
      std::uint8_t v = 0;
      auto ec = co_await server.async_receive_with(
        [&v](core::CursorBuffer& buf) { return codec::read_u8(buf, v); });
      TEST_EXPECT_ERROR(ec, codec::errc::size_mismatch);
      TEST_EXPECT(!server.desynchronized());

      auto [ec2, got] = co_await server.async_receive_frame();
      TEST_EXPECT_OK(ec2);
      TEST_EXPECT_BYTES(got, hex("09"));
      done = true;
    },
    asio::detached);
  ioc.run();
  TEST_EXPECT(done);
}

void test_channel_destroyed_before_pending_receive() {
  // io_context 先于通道构造、后于通道析构：挂起的传输协程在通道销毁之后才随之销毁。
  asio::io_context ioc;
  auto duplex = make_memory_duplex(ioc.get_executor());
  bool finished = false;
  {
    auto server = std::make_unique<StreamChannel>(std::move(duplex.server_stream), "server");
    asio::co_spawn(
      ioc,
      [&finished, ch = server.get()]() -> asio::awaitable<void> {
        std::vector<byte> dst(4);
        (void)co_await ch->async_receive_exact(mutable_bytes_view{dst.data(), dst.size()});
        finished = true;
      },
      asio::detached);

    ioc.poll();
    TEST_EXPECT(!finished);
    TEST_EXPECT(!server->desynchronized());
  }
  // 不再推进 io_context：传输从未恢复执行，其收尾只触及共享的占用状态。
  TEST_EXPECT(!finished);
}

}  // namespace

int main() {
  test_exact_transfer_with_one_byte_chunks();
  test_length_prefix_is_big_endian();
  test_length_prefix_helpers_match_wire();
  test_frame_roundtrip();
  test_disconnect_mid_transfer();
  test_truncated_frame();
  test_zero_byte_write_is_end_of_stream();
  test_same_side_transfer_rejected();
  test_frame_too_large();
  test_closed_channel();
  test_cancel_desynchronizes();
  test_receive_with_size_mismatch_drains_frame();
  test_channel_destroyed_before_pending_receive();
  return ::blobwire::tests::run_and_report();
}
