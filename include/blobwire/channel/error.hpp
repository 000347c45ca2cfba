#pragma once

#include <system_error>

namespace blobwire::channel {

/**
 * @brief 通道层错误码。
 *
 * - unexpected_end_of_stream：传输中途对端关闭（读/写返回 0 字节或 EOF）；对通道致命
 * - transfer_in_progress：同一侧（收或发）已有一次逻辑传输未完成
 * - frame_too_large：长度前缀超过 StreamChannelOptions::max_frame_size
 * - desynchronized：通道此前在帧中途失败，字节位置不可信，只能关闭重建
 * - closed：通道已关闭
 */
enum class errc : int {
  ok = 0,
  unexpected_end_of_stream = 1,
  transfer_in_progress = 2,
  frame_too_large = 3,
  desynchronized = 4,
  closed = 5,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace blobwire::channel

namespace std {
template <>
struct is_error_code_enum<blobwire::channel::errc> : true_type {};
}  // namespace std
