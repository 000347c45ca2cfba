#pragma once

#include "blobwire/core/common.hpp"
#include "blobwire/core/error.hpp"

#include <asio/awaitable.hpp>

#include <cstddef>
#include <system_error>
#include <utility>
#include <vector>

namespace blobwire::core {

/**
 * @brief 就绪钩子：在 CursorBuffer 访问尚未“物化”的字节之前被调用。
 *
 * 说明：
 * - 用于生产者/消费者协同：例如网络 payload 尚未全部到达时就开始流式解码；
 * - 纯内存缓冲区不需要钩子（构造时传 nullptr，即所有字节均已就绪）；
 * - 调用方保证 window 即为“尚未就绪”的尾部区间，实现只能往 window 内写入。
 */
class ReadinessHook {
public:
    virtual ~ReadinessHook() = default;

    /**
     * @brief 让 window 的前 min_bytes 个字节可访问。
     *
     * 成功时返回实际就绪的字节数 n（min_bytes <= n <= window.size()）；
     * 失败时返回非零 error_code（例如对端关闭），此时缓冲区内容不可用。
     */
    virtual asio::awaitable<std::pair<std::error_code, std::size_t>>
    async_make_ready(mutable_bytes_view window, std::size_t min_bytes) = 0;
};

/**
 * @brief 固定容量 + 单向游标的字节缓冲区（单次读或单次写）。
 *
 * 模型：
 * - 容量在构造时确定，之后不再扩容；
 * - offset 只增不减（没有 rewind 接口），一次 pass 结束后丢弃；
 * - 任何落在 [offset, offset+n) 的访问都会先经过就绪钩子，
 *   内部用 ready_ 水位线记录已就绪前缀，钩子只为未就绪部分调用；
 * - 越过容量的访问返回 errc::buffer_overrun，不截断、不推进游标。
 *
 * 注意：
 * - 本类不做线程安全保证；一个缓冲区只属于一个读/写 pass。
 */
class CursorBuffer final {
public:
    explicit CursorBuffer(std::size_t capacity, ReadinessHook *hook = nullptr);

    // 以已有字节构造（用于读 pass，所有字节均已就绪）。
    [[nodiscard]] static CursorBuffer from_bytes(bytes_view contents);

    CursorBuffer(CursorBuffer &&other) noexcept;
    CursorBuffer &operator=(CursorBuffer &&other) noexcept;

    CursorBuffer(const CursorBuffer &) = delete;
    CursorBuffer &operator=(const CursorBuffer &) = delete;

    ~CursorBuffer() = default;

    [[nodiscard]] std::size_t capacity() const noexcept { return backing_.size(); }
    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
    [[nodiscard]] std::size_t remaining() const noexcept {
        return backing_.size() - offset_;
    }
    [[nodiscard]] bool exhausted() const noexcept {
        return offset_ == backing_.size();
    }

    // 已就绪的前缀长度（无钩子时恒等于 capacity）。
    [[nodiscard]] std::size_t ready() const noexcept { return ready_; }

    // 整个 backing 区域（仅用于诊断与发送；未就绪部分内容无意义）。
    [[nodiscard]] bytes_view contents() const noexcept {
        return bytes_view{backing_.data(), backing_.size()};
    }

    [[nodiscard]] std::vector<byte> release() && noexcept;

    /**
     * @brief 申请访问 [offset, offset+n)：越界检查 -> 就绪钩子 -> 游标前移 n。
     *
     * 成功时 region 指向本次可读写的 n 个字节。
     */
    asio::awaitable<std::error_code> async_advance(std::size_t n,
                                                   mutable_bytes_view &region);

    // 让全部字节就绪（不移动游标），用于丢弃剩余帧内容或诊断输出。
    asio::awaitable<std::error_code> async_make_all_ready();

private:
    asio::awaitable<std::error_code> async_ensure_ready(std::size_t end);

    std::vector<byte> backing_;
    ReadinessHook *hook_{nullptr};
    std::size_t offset_{0};
    std::size_t ready_{0};
};

} // namespace blobwire::core
