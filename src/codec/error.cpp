#include "blobwire/codec/error.hpp"
#include "core/error_table.hpp"

namespace blobwire::codec {
namespace {

constexpr std::array<core::detail::ErrcText<errc>, 5> kMessages{{
    {errc::ok, "ok"},
    {errc::malformed_optional, "malformed optional"},
    {errc::decode_error, "decode error"},
    {errc::length_overflow, "length does not fit a 32-bit prefix"},
    {errc::size_mismatch, "encoded size mismatch"},
}};

} // namespace

const std::error_category &error_category() noexcept {
    static const core::detail::TableErrorCategory category("blobwire.codec", kMessages);
    return category;
}

std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

} // namespace blobwire::codec
