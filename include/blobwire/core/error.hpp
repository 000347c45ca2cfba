#pragma once

#include <system_error>

namespace blobwire::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有异步/协程接口优先返回 std::error_code，避免异常路径。
 * - buffer_overrun：访问越过 CursorBuffer 容量。
 *   一定意味着 size_of/write/read 不一致，或者 payload 被截断/损坏；
 *   对当前消息是致命错误，不做重试。
 * - invalid_argument：参数不合法（例如 16 进制文本无法解析、就绪钩子返回的字节数越界）。
 */
enum class errc : int {
  ok = 0,
  buffer_overrun = 1,
  invalid_argument = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace blobwire::core

namespace std {
template <>
struct is_error_code_enum<blobwire::core::errc> : true_type {};
}  // namespace std
