#pragma once
#include <lexpath/core/Error.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace LP {

/**
 * Number of bytes in the UTF-8 sequence introduced by `lead`, read from a
 * 256 entry table. Continuation bytes report 1 so a scan always advances.
 * Bytes that could only start 5+ byte sequences report their leading one
 * count (5..8); callers treat anything >= 4 as "not a BMP scalar".
 */
[[nodiscard]] auto utf8_sequence_length(std::uint8_t lead) noexcept -> std::uint8_t;

/**
 * Convert one UTF-8 encoded scalar of 1 to 3 bytes to a single UTF-16 code
 * unit. Only the bytes needed by the lead byte are read; the result for
 * truncated or non-BMP input is unspecified but never reads out of range.
 */
[[nodiscard]] auto bmp_utf8_to_utf16(std::string_view bytes) noexcept -> char16_t;

// Number of bytes needed to encode a single UTF-16 code unit as UTF-8.
[[nodiscard]] constexpr auto utf8_width(char16_t unit) noexcept -> std::size_t {
    if (unit < 0x80)
        return 1;
    if (unit < 0x800)
        return 2;
    return 3;
}

// Number of UTF-16 code units needed for `text`, which is assumed to be UTF-8.
[[nodiscard]] auto utf16_length(std::string_view text) noexcept -> std::size_t;

[[nodiscard]] auto utf8_to_utf16(std::string_view text) -> Expected<std::u16string>;
[[nodiscard]] auto utf16_to_utf8(std::u16string_view text) -> Expected<std::string>;

} // namespace LP
