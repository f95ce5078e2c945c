#include <lexpath/codec/Utf.hpp>

#include <array>
#include <bit>

namespace {

constexpr auto kSequenceLengths = [] {
    std::array<std::uint8_t, 256> table{};
    for (std::size_t i = 0; i < table.size(); ++i) {
        auto ones = std::countl_one(static_cast<std::uint8_t>(i));
        table[i]  = ones == 0 ? 1 : static_cast<std::uint8_t>(ones);
    }
    return table;
}();

static_assert(kSequenceLengths['a'] == 1);
static_assert(kSequenceLengths[0x80] == 1);
static_assert(kSequenceLengths[0xC2] == 2);
static_assert(kSequenceLengths[0xE4] == 3);
static_assert(kSequenceLengths[0xF0] == 4);

constexpr auto is_continuation(unsigned char byte) -> bool {
    return (byte & 0xC0) == 0x80;
}

auto malformed(std::string message) -> LP::Error {
    return LP::Error{LP::Error::Code::MalformedInput, std::move(message)};
}

} // namespace

namespace LP {

auto utf8_sequence_length(std::uint8_t lead) noexcept -> std::uint8_t {
    return kSequenceLengths[lead];
}

auto bmp_utf8_to_utf16(std::string_view bytes) noexcept -> char16_t {
    if (bytes.empty())
        return 0;
    auto const b0 = static_cast<unsigned char>(bytes[0]);
    switch (utf8_sequence_length(b0)) {
    case 1:
        return static_cast<char16_t>(b0);
    case 2:
        if (bytes.size() < 2)
            return 0;
        return static_cast<char16_t>(((b0 & 0x1F) << 6) | (static_cast<unsigned char>(bytes[1]) & 0x3F));
    default:
        if (bytes.size() < 3)
            return 0;
        return static_cast<char16_t>(((b0 & 0x0F) << 12) | ((static_cast<unsigned char>(bytes[1]) & 0x3F) << 6)
                                     | (static_cast<unsigned char>(bytes[2]) & 0x3F));
    }
}

auto utf16_length(std::string_view text) noexcept -> std::size_t {
    std::size_t units = 0;
    std::size_t pos   = 0;
    while (pos < text.size()) {
        auto len = utf8_sequence_length(static_cast<std::uint8_t>(text[pos]));
        units += len >= 4 ? 2 : 1;
        pos += len;
    }
    return units;
}

auto utf8_to_utf16(std::string_view text) -> Expected<std::u16string> {
    std::u16string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto const lead = static_cast<unsigned char>(text[pos]);
        auto const len  = utf8_sequence_length(lead);
        if (len > 4 || (len == 1 && lead >= 0x80))
            return std::unexpected(malformed("invalid UTF-8 lead byte"));
        if (pos + len > text.size())
            return std::unexpected(malformed("truncated UTF-8 sequence"));
        char32_t scalar = len == 1 ? lead : (lead & (0x7F >> len));
        for (std::size_t i = 1; i < len; ++i) {
            auto const byte = static_cast<unsigned char>(text[pos + i]);
            if (!is_continuation(byte))
                return std::unexpected(malformed("invalid UTF-8 continuation byte"));
            scalar = (scalar << 6) | (byte & 0x3F);
        }
        pos += len;

        if (scalar >= 0x10000) {
            if (scalar > 0x10FFFF)
                return std::unexpected(malformed("scalar value out of range"));
            scalar -= 0x10000;
            out.push_back(static_cast<char16_t>(0xD800 + (scalar >> 10)));
            out.push_back(static_cast<char16_t>(0xDC00 + (scalar & 0x3FF)));
        } else {
            out.push_back(static_cast<char16_t>(scalar));
        }
    }
    return out;
}

auto utf16_to_utf8(std::u16string_view text) -> Expected<std::string> {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char32_t scalar = text[i];
        if (scalar >= 0xD800 && scalar <= 0xDBFF) {
            if (i + 1 >= text.size() || text[i + 1] < 0xDC00 || text[i + 1] > 0xDFFF)
                return std::unexpected(malformed("unpaired high surrogate"));
            scalar = 0x10000 + ((scalar - 0xD800) << 10) + (text[i + 1] - 0xDC00);
            ++i;
        } else if (scalar >= 0xDC00 && scalar <= 0xDFFF) {
            return std::unexpected(malformed("unpaired low surrogate"));
        }

        if (scalar < 0x80) {
            out.push_back(static_cast<char>(scalar));
        } else if (scalar < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (scalar >> 6)));
            out.push_back(static_cast<char>(0x80 | (scalar & 0x3F)));
        } else if (scalar < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (scalar >> 12)));
            out.push_back(static_cast<char>(0x80 | ((scalar >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (scalar & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (scalar >> 18)));
            out.push_back(static_cast<char>(0x80 | ((scalar >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((scalar >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (scalar & 0x3F)));
        }
    }
    return out;
}

} // namespace LP
