#include <lexpath/windows/PathKind.hpp>

#include <lexpath/codec/Utf.hpp>

#include <algorithm>

namespace {

constexpr std::string_view kVerbatimPrefix = R"(\\?\)";

constexpr auto is_separator(char c) noexcept -> bool {
    return c == '\\' || c == '/';
}

auto classify_non_ascii(std::string_view path) noexcept -> std::pair<LP::WinPathKind, std::size_t> {
    auto const lead  = static_cast<std::uint8_t>(path[0]);
    auto const width = LP::utf8_sequence_length(lead);
    // Stray continuation bytes and astral scalars can never start a drive.
    if (lead < 0xC0 || width >= 4 || path.size() < width)
        return {LP::WinPathKind::currentDirectoryRelative(), 0};

    auto const sequence = path.substr(0, width);
    if (!std::all_of(sequence.begin() + 1, sequence.end(), [](char c) { return (c & 0xC0) == 0x80; }))
        return {LP::WinPathKind::currentDirectoryRelative(), 0};

    // Overlong encodings and surrogates would not re-encode to the same bytes.
    auto const letter = LP::bmp_utf8_to_utf16(sequence);
    if (LP::utf8_width(letter) != width || (letter >= 0xD800 && letter <= 0xDFFF))
        return {LP::WinPathKind::currentDirectoryRelative(), 0};

    auto const after = path.substr(width);
    if (after.size() >= 2 && after[0] == ':' && is_separator(after[1]))
        return {LP::WinPathKind::drive(letter), width + 2u};
    if (!after.empty() && after[0] == ':')
        return {LP::WinPathKind::driveRelative(letter), width + 1u};
    return {LP::WinPathKind::currentDirectoryRelative(), 0};
}

} // namespace

namespace LP {

auto WinPathKind::fromString(std::string_view path) noexcept -> WinPathKind {
    return fromStringWithLength(path).first;
}

auto WinPathKind::fromStringWithLength(std::string_view path) noexcept -> std::pair<WinPathKind, std::size_t> {
    if (path.empty())
        return {currentDirectoryRelative(), 0};
    if (path.starts_with(kVerbatimPrefix))
        return {verbatim(), kVerbatimPrefix.size()};
    if (static_cast<unsigned char>(path[0]) >= 0x80)
        return classify_non_ascii(path);

    // Device must be tried before Unc, both start with two separators.
    if (path.size() >= 4 && is_separator(path[0]) && is_separator(path[1]) && (path[2] == '.' || path[2] == '?')
        && is_separator(path[3]))
        return {device(), 4};
    if (path.size() >= 2 && is_separator(path[0]) && is_separator(path[1]))
        return {unc(), 2};
    if (is_separator(path[0]))
        return {rootRelative(), 1};

    auto const letter = static_cast<char16_t>(static_cast<unsigned char>(path[0]));
    if (path.size() >= 3 && path[1] == ':' && is_separator(path[2]))
        return {drive(letter), 3};
    if (path.size() >= 2 && path[1] == ':')
        return {driveRelative(letter), 2};
    return {currentDirectoryRelative(), 0};
}

auto WinPathKind::split(std::string_view path) noexcept -> std::pair<WinPathKind, std::string_view> {
    auto const [kind, length] = fromStringWithLength(path);
    return {kind, path.substr(length)};
}

auto WinPathKind::asRelative() const noexcept -> std::optional<Win32Relative> {
    switch (type_) {
    case Type::CurrentDirectoryRelative:
        return Win32Relative::currentDirectory();
    case Type::DriveRelative:
        return Win32Relative::driveRelative(drive_);
    case Type::RootRelative:
        return Win32Relative::root();
    default:
        return std::nullopt;
    }
}

auto WinPathKind::utf16Length() const noexcept -> std::size_t {
    switch (type_) {
    case Type::Drive:
        return 3;
    case Type::Unc:
        return 2;
    case Type::Device:
    case Type::Verbatim:
        return 4;
    case Type::CurrentDirectoryRelative:
        return 0;
    case Type::DriveRelative:
        return 2;
    case Type::RootRelative:
        return 1;
    }
    return 0;
}

auto WinPathKind::utf8Length() const noexcept -> std::size_t {
    switch (type_) {
    case Type::Drive:
        return utf8_width(drive_) + 2;
    case Type::DriveRelative:
        return utf8_width(drive_) + 1;
    default:
        return this->utf16Length();
    }
}

auto WinPathKind::name() const noexcept -> std::string_view {
    switch (type_) {
    case Type::Drive:
        return "Drive";
    case Type::Unc:
        return "Unc";
    case Type::Device:
        return "Device";
    case Type::CurrentDirectoryRelative:
        return "CurrentDirectoryRelative";
    case Type::Verbatim:
        return "Verbatim";
    case Type::DriveRelative:
        return "DriveRelative";
    case Type::RootRelative:
        return "RootRelative";
    }
    return "Unknown";
}

auto Win32Relative::fromKind(WinPathKind kind) noexcept -> std::optional<Win32Relative> {
    return kind.asRelative();
}

auto Win32Absolute::fromKind(WinPathKind kind) noexcept -> std::optional<Win32Absolute> {
    switch (kind.type()) {
    case WinPathKind::Type::Drive:
        return Win32Absolute::drive(*kind.driveLetter());
    case WinPathKind::Type::Unc:
        return Win32Absolute::unc();
    case WinPathKind::Type::Device:
        return Win32Absolute::device();
    default:
        return std::nullopt;
    }
}

auto is_verbatim(std::string_view path) noexcept -> bool {
    return path.starts_with(kVerbatimPrefix);
}

auto split_verbatim(std::string_view path) noexcept -> std::optional<VerbatimParts> {
    if (!is_verbatim(path))
        return std::nullopt;
    auto const rest = path.substr(kVerbatimPrefix.size());

    if (rest == "UNC" || rest.starts_with(R"(UNC\)"))
        return VerbatimParts{Win32Absolute::unc(), rest.substr(3)};

    auto const driveAt = [&](std::size_t width) -> bool {
        return rest.size() > width && rest[width] == ':' && (rest.size() == width + 1 || rest[width + 1] == '\\');
    };
    if (!rest.empty()) {
        auto const lead = static_cast<unsigned char>(rest[0]);
        if (lead < 0x80 && driveAt(1))
            return VerbatimParts{Win32Absolute::drive(static_cast<char16_t>(lead)), rest};
        if (utf8_sequence_length(lead) == 2 && lead >= 0xC2 && driveAt(2) && (rest[1] & 0xC0) == 0x80)
            return VerbatimParts{Win32Absolute::drive(bmp_utf8_to_utf16(rest.substr(0, 2))), rest};
    }
    return VerbatimParts{Win32Absolute::device(), rest};
}

auto ParsedPath::parse(std::string_view path) noexcept -> ParsedPath {
    auto const [kind, length] = WinPathKind::fromStringWithLength(path);
    if (kind.type() != WinPathKind::Type::Unc)
        return ParsedPath{path, kind, length};

    // Extend over `server\share\`; a missing piece runs to the end of the text.
    auto const isSep  = [](char c) { return is_separator(c); };
    auto const rest   = path.substr(length);
    auto const server = std::find_if(rest.begin(), rest.end(), isSep);
    if (server == rest.end())
        return ParsedPath{path, kind, path.size()};
    auto const share = std::find_if(server + 1, rest.end(), isSep);
    if (share == rest.end())
        return ParsedPath{path, kind, path.size()};
    return ParsedPath{path, kind, length + static_cast<std::size_t>(share - rest.begin()) + 1};
}

auto ParsedPath::prefixUtf16Length() const noexcept -> std::size_t {
    if (kind_.type() == WinPathKind::Type::Unc)
        return utf16_length(this->prefix());
    return kind_.utf16Length();
}

auto ParsedPath::normalizedPrefix() const -> std::string {
    switch (kind_.type()) {
    case WinPathKind::Type::Drive: {
        std::string prefix{this->prefix()};
        prefix.back() = '\\';
        return prefix;
    }
    case WinPathKind::Type::DriveRelative:
        return std::string{this->prefix()};
    case WinPathKind::Type::Device:
        return std::string{R"(\\)"} + path_[2] + '\\';
    case WinPathKind::Type::Verbatim:
        return std::string{kVerbatimPrefix};
    case WinPathKind::Type::RootRelative:
        return R"(\)";
    case WinPathKind::Type::Unc:
        return R"(\\)";
    case WinPathKind::Type::CurrentDirectoryRelative:
        break;
    }
    return {};
}

} // namespace LP
