#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace tbson::detail {

/**
 * @brief Read a little-endian encoded integer from the beginning of a byte span
 *
 * @tparam Int The integer type to be read
 * @param bytes The input bytes. Must contain at least `sizeof(Int)` bytes
 */
template <typename Int>
constexpr Int read_int_le(std::span<const std::byte> bytes) noexcept {
    using U = std::make_unsigned_t<Int>;
    U u     = 0;
    for (std::size_t n = 0; n < sizeof u; ++n) {
        // Cast to unsigned byte first to prevent a sign-extension
        U b = static_cast<std::uint8_t>(bytes[n]);
        b <<= (8 * n);
        u |= b;
    }
    return static_cast<Int>(u);
}

/**
 * @brief Read a little-endian IEEE 754 double from the beginning of a byte span
 */
inline double read_double_le(std::span<const std::byte> bytes) noexcept {
    return std::bit_cast<double>(read_int_le<std::uint64_t>(bytes));
}

/**
 * @brief View a span of bytes as characters
 */
inline std::string_view as_chars(std::span<const std::byte> bytes) noexcept {
    return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

/**
 * @brief Test whether the given string is well-formed UTF-8.
 *
 * Rejects overlong encodings, surrogate code points, and code points above
 * U+10FFFF.
 */
constexpr bool is_valid_utf8(std::string_view s) noexcept {
    std::size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<std::uint8_t>(s[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }
        std::size_t   len = 0;
        std::uint32_t cp  = 0;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp  = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp  = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp  = c & 0x07;
        } else {
            return false;
        }
        if (s.size() - i < len) {
            return false;
        }
        for (std::size_t n = 1; n < len; ++n) {
            const auto cont = static_cast<std::uint8_t>(s[i + n]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        const bool overlong = (len == 2 and cp < 0x80) or (len == 3 and cp < 0x800)
            or (len == 4 and cp < 0x10000);
        if (overlong or cp > 0x10FFFF or (cp >= 0xD800 and cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

}  // namespace tbson::detail
