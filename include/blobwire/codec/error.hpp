#pragma once

#include <system_error>

namespace blobwire::codec {

/**
 * @brief 编解码层错误码。
 *
 * - malformed_optional：Optional 解出的元素个数不是 0 或 1
 * - decode_error：组合子/叶子观察到形状之外的值（例如 Bool 不是 0/1、十进制文本非法）
 * - length_overflow：序列元素个数或字节串长度无法用 4 字节前缀表示
 * - size_mismatch：write/read 实际消耗的字节数与 size_of/帧长度不一致
 *
 * 以上错误只对当前消息致命；越界访问统一使用 core::errc::buffer_overrun。
 */
enum class errc : int {
  ok = 0,
  malformed_optional = 1,
  decode_error = 2,
  length_overflow = 3,
  size_mismatch = 4,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace blobwire::codec

namespace std {
template <>
struct is_error_code_enum<blobwire::codec::errc> : true_type {};
}  // namespace std
