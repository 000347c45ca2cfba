#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>
#include <system_error>

namespace blobwire::core::detail {

template <class Errc>
struct ErrcText final {
    Errc code;
    const char *text;
};

/**
 * @brief 以 (错误码, 描述) 表实现的 std::error_category。
 *
 * core/codec/channel 三个错误域共用本实现，各自只提供名字和描述表；
 * 表中没有的数值统一描述为 "unknown <name> error"。
 */
template <class Errc, std::size_t N>
class TableErrorCategory final : public std::error_category {
public:
    TableErrorCategory(const char *name,
                       const std::array<ErrcText<Errc>, N> &entries) noexcept
        : name_(name), entries_(entries) {}

    const char *name() const noexcept override { return name_; }

    std::string message(int ev) const override {
        const auto code = static_cast<Errc>(ev);
        const auto it =
            std::find_if(entries_.begin(), entries_.end(),
                         [code](const ErrcText<Errc> &e) { return e.code == code; });
        if (it == entries_.end()) {
            return std::string("unknown ") + name_ + " error";
        }
        return it->text;
    }

private:
    const char *name_;
    std::array<ErrcText<Errc>, N> entries_;
};

} // namespace blobwire::core::detail
