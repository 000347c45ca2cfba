#include "blobwire/channel/error.hpp"
#include "blobwire/codec/error.hpp"
#include "blobwire/core/error.hpp"

#include "test_main.hpp"

#include <string>
#include <string_view>

namespace {

namespace core = blobwire::core;
namespace codec = blobwire::codec;
namespace channel = blobwire::channel;

void test_error_category_names() {
  TEST_EXPECT_EQ(std::string_view(core::make_error_code(core::errc::buffer_overrun).category().name()),
                 "blobwire.core");
  TEST_EXPECT_EQ(
    std::string_view(codec::make_error_code(codec::errc::decode_error).category().name()),
    "blobwire.codec");
  TEST_EXPECT_EQ(std::string_view(
                   channel::make_error_code(channel::errc::closed).category().name()),
                 "blobwire.channel");
}

void test_core_messages() {
  TEST_EXPECT_EQ(core::make_error_code(core::errc::ok).message(), "ok");
  TEST_EXPECT_EQ(core::make_error_code(core::errc::buffer_overrun).message(), "buffer overrun");
  TEST_EXPECT_EQ(core::make_error_code(core::errc::invalid_argument).message(), "invalid argument");
}

void test_codec_messages() {
  TEST_EXPECT_EQ(codec::make_error_code(codec::errc::malformed_optional).message(),
                 "malformed optional");
  TEST_EXPECT_EQ(codec::make_error_code(codec::errc::decode_error).message(), "decode error");
  TEST_EXPECT_EQ(codec::make_error_code(codec::errc::size_mismatch).message(),
                 "encoded size mismatch");
  TEST_EXPECT(!codec::make_error_code(codec::errc::length_overflow).message().empty());
}

void test_channel_messages() {
  TEST_EXPECT_EQ(channel::make_error_code(channel::errc::unexpected_end_of_stream).message(),
                 "unexpected end of stream");
  TEST_EXPECT_EQ(channel::make_error_code(channel::errc::desynchronized).message(),
                 "channel desynchronized");
  TEST_EXPECT_EQ(channel::make_error_code(channel::errc::frame_too_large).message(),
                 "frame too large");
  TEST_EXPECT(!channel::make_error_code(channel::errc::transfer_in_progress).message().empty());
}

void test_categories_are_distinct() {
  // 三个错误域的数值可能相同，但 error_code 必须能区分“payload 损坏”和“对端断开”。
  const std::error_code overrun = core::errc::buffer_overrun;
  const std::error_code malformed = codec::errc::malformed_optional;
  const std::error_code eos = channel::errc::unexpected_end_of_stream;
  TEST_EXPECT(overrun != malformed);
  TEST_EXPECT(malformed != eos);
  TEST_EXPECT(overrun != eos);
  TEST_EXPECT(overrun.category() != eos.category());
}

void test_unknown_error_code() {
  std::error_code ec(9999, core::error_category());
  TEST_EXPECT_EQ(ec.message(), "unknown blobwire.core error");
  std::error_code codec_ec(9999, codec::error_category());
  TEST_EXPECT_EQ(codec_ec.message(), "unknown blobwire.codec error");
  std::error_code channel_ec(9999, channel::error_category());
  TEST_EXPECT_EQ(channel_ec.message(), "unknown blobwire.channel error");
}

// 0..last 的每个取值都必须有自己的描述，不能落到 "unknown" 分支。
void expect_all_described(const std::error_category& category, int last) {
  for (int ev = 0; ev <= last; ++ev) {
    const std::string text = category.message(ev);
    TEST_EXPECT(!text.empty());
    TEST_EXPECT(text.rfind("unknown", 0) != 0);
  }
  TEST_EXPECT_EQ(category.message(last + 1).rfind("unknown", 0), 0u);
}

void test_every_code_is_described() {
  expect_all_described(core::error_category(), static_cast<int>(core::errc::invalid_argument));
  expect_all_described(codec::error_category(), static_cast<int>(codec::errc::size_mismatch));
  expect_all_described(channel::error_category(), static_cast<int>(channel::errc::closed));
  TEST_EXPECT_EQ(codec::make_error_code(codec::errc::length_overflow).message(),
                 "length does not fit a 32-bit prefix");
  TEST_EXPECT_EQ(channel::make_error_code(channel::errc::closed).message(), "channel closed");
}

}  // namespace

int main() {
  test_error_category_names();
  test_core_messages();
  test_codec_messages();
  test_channel_messages();
  test_categories_are_distinct();
  test_unknown_error_code();
  test_every_code_is_described();
  return ::blobwire::tests::run_and_report();
}
