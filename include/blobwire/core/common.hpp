#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace blobwire::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// 长度前缀/计数前缀均为 4 字节大端无符号整数。
inline constexpr std::size_t kLengthPrefixSize = 4;

// 单帧 payload 默认上限：length 来自网络输入，需要上限避免恶意 length 触发巨量分配。
inline constexpr std::uint32_t kDefaultMaxFrameSize = 64u * 1024u * 1024u;  // 64MB

}  // 命名空间 blobwire::core
