#include "blobwire/core/cursor_buffer.hpp"

#include <algorithm>

namespace blobwire::core {

CursorBuffer::CursorBuffer(std::size_t capacity, ReadinessHook *hook)
    : backing_(capacity), hook_(hook), ready_(hook ? 0 : capacity) {}

CursorBuffer CursorBuffer::from_bytes(bytes_view contents) {
    CursorBuffer buf(contents.size());
    std::copy(contents.begin(), contents.end(), buf.backing_.begin());
    return buf;
}

CursorBuffer::CursorBuffer(CursorBuffer &&other) noexcept
    : backing_(std::move(other.backing_)), hook_(other.hook_),
      offset_(other.offset_), ready_(other.ready_) {
    other.hook_ = nullptr;
    other.offset_ = 0;
    other.ready_ = 0;
}

CursorBuffer &CursorBuffer::operator=(CursorBuffer &&other) noexcept {
    if (this == &other) {
        return *this;
    }
    backing_ = std::move(other.backing_);
    hook_ = other.hook_;
    offset_ = other.offset_;
    ready_ = other.ready_;

    other.hook_ = nullptr;
    other.offset_ = 0;
    other.ready_ = 0;
    return *this;
}

std::vector<byte> CursorBuffer::release() && noexcept {
    offset_ = 0;
    ready_ = 0;
    return std::move(backing_);
}

asio::awaitable<std::error_code>
CursorBuffer::async_ensure_ready(std::size_t end) {
    if (end <= ready_) {
        co_return std::error_code{};
    }
    if (!hook_) {
        // 无钩子时 ready_ == capacity，走到这里说明调用方已越界。
        co_return make_error_code(errc::buffer_overrun);
    }

    const std::size_t need = end - ready_;
    auto window =
        mutable_bytes_view{backing_.data() + ready_, backing_.size() - ready_};
    auto [ec, n] = co_await hook_->async_make_ready(window, need);
    if (ec) {
        co_return ec;
    }
    if (n < need || n > window.size()) {
        co_return make_error_code(errc::invalid_argument);
    }
    ready_ += n;
    co_return std::error_code{};
}

asio::awaitable<std::error_code>
CursorBuffer::async_advance(std::size_t n, mutable_bytes_view &region) {
    region = {};
    if (n > remaining()) {
        co_return make_error_code(errc::buffer_overrun);
    }
    if (n == 0) {
        co_return std::error_code{};
    }

    auto ec = co_await async_ensure_ready(offset_ + n);
    if (ec) {
        co_return ec;
    }

    region = mutable_bytes_view{backing_.data() + offset_, n};
    offset_ += n;
    co_return std::error_code{};
}

asio::awaitable<std::error_code> CursorBuffer::async_make_all_ready() {
    co_return co_await async_ensure_ready(backing_.size());
}

} // namespace blobwire::core
