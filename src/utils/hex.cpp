#include "blobwire/utils/hex.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace blobwire::utils {
namespace {

[[nodiscard]] int hex_value_(unsigned char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] bool is_separator_(unsigned char c) noexcept {
    if (std::isspace(c) != 0) {
        return true;
    }
    return c == ',' || c == ':' || c == '-' || c == '_';
}

[[nodiscard]] char to_printable_ascii_(core::byte b) noexcept {
    const auto c = static_cast<unsigned char>(b);
    if (c >= 0x20 && c <= 0x7E) {
        return static_cast<char>(c);
    }
    return '.';
}

} // namespace

std::string hex_dump(core::bytes_view bytes, HexDumpOptions options) {
    std::ostringstream oss;

    const std::size_t total = bytes.size();
    const std::size_t max_bytes =
        (options.max_bytes == 0 ? total : std::min(total, options.max_bytes));
    const std::size_t per_line = (options.bytes_per_line == 0
                                      ? static_cast<std::size_t>(16)
                                      : options.bytes_per_line);

    for (std::size_t offset = 0; offset < max_bytes; offset += per_line) {
        const std::size_t line_n = std::min(per_line, max_bytes - offset);

        if (options.show_offset) {
            oss << std::setw(4) << std::setfill('0') << std::hex << offset
                << ": ";
        }

        for (std::size_t i = 0; i < line_n; ++i) {
            oss << std::setw(2) << std::setfill('0') << std::hex
                << static_cast<int>(bytes[offset + i]);
            if (i + 1 != line_n) {
                oss << ' ';
            }
        }

        if (options.show_ascii) {
            // 末行补齐缺失的 " HH" 列，保证 ASCII 列对齐。
            oss << std::string((per_line - line_n) * 3 + 1, ' ');
            oss << "  ";
            for (std::size_t i = 0; i < line_n; ++i) {
                oss << to_printable_ascii_(bytes[offset + i]);
            }
        }

        oss << '\n';
    }

    if (options.max_bytes != 0 && total > options.max_bytes) {
        oss << "... (truncated, total=" << std::dec << total << " bytes)\n";
    }

    return oss.str();
}

std::string describe_buffer(const core::CursorBuffer &buf,
                            HexDumpOptions options) {
    std::ostringstream oss;
    oss << "[[ offset:" << buf.offset() << " ready:" << buf.ready()
        << " len:" << buf.capacity() << " ]]\n";
    oss << hex_dump(buf.contents().first(buf.ready()), options);
    return oss.str();
}

std::error_code parse_hex(std::string_view text,
                          std::vector<core::byte> &out) noexcept {
    out.clear();

    int hi_nibble = -1;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);

        if (is_separator_(c)) {
            continue;
        }

        // 可选 0x/0X 前缀：仅在一个字节的起始位置识别。
        if (c == '0' && hi_nibble < 0 && (i + 1) < text.size()) {
            const auto n = static_cast<unsigned char>(text[i + 1]);
            if (n == 'x' || n == 'X') {
                ++i;
                continue;
            }
        }

        const int v = hex_value_(c);
        if (v < 0) {
            out.clear();
            return core::make_error_code(core::errc::invalid_argument);
        }

        if (hi_nibble < 0) {
            hi_nibble = v;
            continue;
        }

        out.push_back(static_cast<core::byte>((hi_nibble << 4) | v));
        hi_nibble = -1;
    }

    // 16 进制必须是偶数个 nibble。
    if (hi_nibble >= 0) {
        out.clear();
        return core::make_error_code(core::errc::invalid_argument);
    }

    return {};
}

} // namespace blobwire::utils
