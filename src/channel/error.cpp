#include "blobwire/channel/error.hpp"
#include "core/error_table.hpp"

namespace blobwire::channel {
namespace {

constexpr std::array<core::detail::ErrcText<errc>, 6> kMessages{{
    {errc::ok, "ok"},
    {errc::unexpected_end_of_stream, "unexpected end of stream"},
    {errc::transfer_in_progress, "transfer already in progress on this side"},
    {errc::frame_too_large, "frame too large"},
    {errc::desynchronized, "channel desynchronized"},
    {errc::closed, "channel closed"},
}};

} // namespace

const std::error_category &error_category() noexcept {
    static const core::detail::TableErrorCategory category("blobwire.channel", kMessages);
    return category;
}

std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

} // namespace blobwire::channel
