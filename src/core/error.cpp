#include "blobwire/core/error.hpp"
#include "error_table.hpp"

namespace blobwire::core {
namespace {

// message() 只用于日志与调试输出，不参与线上格式。
constexpr std::array<detail::ErrcText<errc>, 3> kMessages{{
    {errc::ok, "ok"},
    {errc::buffer_overrun, "buffer overrun"},
    {errc::invalid_argument, "invalid argument"},
}};

} // namespace

const std::error_category &error_category() noexcept {
    static const detail::TableErrorCategory category("blobwire.core", kMessages);
    return category;
}

std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

} // namespace blobwire::core
