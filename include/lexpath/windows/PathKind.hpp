#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace LP {

class Win32Relative;

/**
 * The kind of a Windows path, decided from its first few characters only.
 * Parsing never fails: broken or nonsense paths still get exactly one kind.
 *
 * Drive letters are stored as a single UTF-16 code unit so non-ASCII drive
 * letters (anything in the BMP) are representable.
 */
class WinPathKind {
public:
    enum class Type {
        // `C:\`
        Drive,
        // `\\server\share\`
        Unc,
        // `\\.\COM1`, and `\\?\` spelled with any mix of separators other than the exact verbatim prefix.
        Device,
        // `file`
        CurrentDirectoryRelative,
        // Exactly `\\?\`; passed to the kernel with only the prefix changed.
        Verbatim,
        // `C:file`
        DriveRelative,
        // `\file`
        RootRelative,
    };

    [[nodiscard]] static constexpr auto drive(char16_t letter) noexcept -> WinPathKind {
        return WinPathKind{Type::Drive, letter};
    }
    [[nodiscard]] static constexpr auto driveRelative(char16_t letter) noexcept -> WinPathKind {
        return WinPathKind{Type::DriveRelative, letter};
    }
    [[nodiscard]] static constexpr auto unc() noexcept -> WinPathKind { return WinPathKind{Type::Unc}; }
    [[nodiscard]] static constexpr auto device() noexcept -> WinPathKind { return WinPathKind{Type::Device}; }
    [[nodiscard]] static constexpr auto verbatim() noexcept -> WinPathKind { return WinPathKind{Type::Verbatim}; }
    [[nodiscard]] static constexpr auto rootRelative() noexcept -> WinPathKind {
        return WinPathKind{Type::RootRelative};
    }
    [[nodiscard]] static constexpr auto currentDirectoryRelative() noexcept -> WinPathKind {
        return WinPathKind{Type::CurrentDirectoryRelative};
    }

    [[nodiscard]] static auto fromString(std::string_view path) noexcept -> WinPathKind;

    /**
     * The kind plus the number of UTF-8 bytes that identify it. This is the
     * smallest prefix needed to decide the kind, so for UNC paths it is only
     * the leading `\\`; see ParsedPath for the full `\\server\share\` prefix.
     */
    [[nodiscard]] static auto fromStringWithLength(std::string_view path) noexcept -> std::pair<WinPathKind, std::size_t>;
    [[nodiscard]] static auto split(std::string_view path) noexcept -> std::pair<WinPathKind, std::string_view>;

    [[nodiscard]] constexpr auto type() const noexcept -> Type { return type_; }
    [[nodiscard]] constexpr auto driveLetter() const noexcept -> std::optional<char16_t> {
        if (type_ == Type::Drive || type_ == Type::DriveRelative)
            return drive_;
        return std::nullopt;
    }

    // Absolute paths do not need to be joined to a base path first.
    [[nodiscard]] constexpr auto isAbsolute() const noexcept -> bool {
        return type_ == Type::Drive || type_ == Type::Unc || type_ == Type::Device || type_ == Type::Verbatim;
    }

    /**
     * The DOS relative forms, `C:file` and `\file`. Reasonable to reject from
     * configuration files, but they do turn up on command lines.
     */
    [[nodiscard]] constexpr auto isLegacyRelative() const noexcept -> bool {
        return type_ == Type::DriveRelative || type_ == Type::RootRelative;
    }

    [[nodiscard]] auto asRelative() const noexcept -> std::optional<Win32Relative>;

    // Length of the identifying prefix in UTF-16 code units.
    [[nodiscard]] auto utf16Length() const noexcept -> std::size_t;
    // Length of the identifying prefix in UTF-8 bytes.
    [[nodiscard]] auto utf8Length() const noexcept -> std::size_t;

    [[nodiscard]] auto name() const noexcept -> std::string_view;

    [[nodiscard]] constexpr auto operator==(WinPathKind const& other) const noexcept -> bool {
        return type_ == other.type_ && drive_ == other.drive_;
    }

private:
    constexpr explicit WinPathKind(Type type, char16_t drive = 0) noexcept : type_(type), drive_(drive) {}

    Type     type_;
    char16_t drive_;
};

class Win32Relative {
public:
    enum class Type { CurrentDirectory, DriveRelative, Root };

    [[nodiscard]] static auto fromKind(WinPathKind kind) noexcept -> std::optional<Win32Relative>;
    [[nodiscard]] static constexpr auto currentDirectory() noexcept -> Win32Relative {
        return Win32Relative{Type::CurrentDirectory};
    }
    [[nodiscard]] static constexpr auto driveRelative(char16_t drive) noexcept -> Win32Relative {
        return Win32Relative{Type::DriveRelative, drive};
    }
    [[nodiscard]] static constexpr auto root() noexcept -> Win32Relative { return Win32Relative{Type::Root}; }

    [[nodiscard]] constexpr auto type() const noexcept -> Type { return type_; }
    [[nodiscard]] constexpr auto drive() const noexcept -> char16_t { return drive_; }
    [[nodiscard]] constexpr auto isLegacyRelative() const noexcept -> bool {
        return type_ == Type::DriveRelative || type_ == Type::Root;
    }

    constexpr bool operator==(Win32Relative const&) const noexcept = default;

private:
    constexpr explicit Win32Relative(Type type, char16_t drive = 0) noexcept : type_(type), drive_(drive) {}

    Type     type_;
    char16_t drive_;
};

// Non-verbatim absolute kinds; also what a verbatim path means once the `\\?\` is gone.
class Win32Absolute {
public:
    enum class Type { Drive, Unc, Device };

    [[nodiscard]] static auto fromKind(WinPathKind kind) noexcept -> std::optional<Win32Absolute>;
    [[nodiscard]] static constexpr auto drive(char16_t letter) noexcept -> Win32Absolute {
        return Win32Absolute{Type::Drive, letter};
    }
    [[nodiscard]] static constexpr auto unc() noexcept -> Win32Absolute { return Win32Absolute{Type::Unc}; }
    [[nodiscard]] static constexpr auto device() noexcept -> Win32Absolute { return Win32Absolute{Type::Device}; }

    [[nodiscard]] constexpr auto type() const noexcept -> Type { return type_; }
    [[nodiscard]] constexpr auto drive() const noexcept -> char16_t { return drive_; }

    constexpr bool operator==(Win32Absolute const&) const noexcept = default;

private:
    constexpr explicit Win32Absolute(Type type, char16_t drive = 0) noexcept : type_(type), drive_(drive) {}

    Type     type_;
    char16_t drive_;
};

struct VerbatimParts {
    Win32Absolute    kind;
    // For UNC this starts after `UNC`, so it is either empty or starts with `\`.
    std::string_view rest;
};

[[nodiscard]] auto is_verbatim(std::string_view path) noexcept -> bool;

// Empty result if `path` is not verbatim.
[[nodiscard]] auto split_verbatim(std::string_view path) noexcept -> std::optional<VerbatimParts>;

/**
 * A path split at its full prefix. Holds a view of the caller's string, so it
 * must not outlive it. `prefix().size() + subpath().size() == path().size()`.
 */
class ParsedPath {
public:
    [[nodiscard]] static auto parse(std::string_view path) noexcept -> ParsedPath;

    [[nodiscard]] auto path() const noexcept -> std::string_view { return path_; }
    [[nodiscard]] auto kind() const noexcept -> WinPathKind { return kind_; }

    [[nodiscard]] auto prefixLength() const noexcept -> std::size_t { return prefixLength_; }
    [[nodiscard]] auto prefixUtf16Length() const noexcept -> std::size_t;

    [[nodiscard]] auto prefix() const noexcept -> std::string_view { return path_.substr(0, prefixLength_); }
    [[nodiscard]] auto subpath() const noexcept -> std::string_view { return path_.substr(prefixLength_); }
    [[nodiscard]] auto parts() const noexcept -> std::pair<std::string_view, std::string_view> {
        return {this->prefix(), this->subpath()};
    }

    /**
     * The canonical spelling of this kind's prefix: `C:\` for drives (any
     * separator becomes `\`), `C:` for drive relative, `\\.\` or `\\?\`
     * keeping the marker for devices, `\\?\`, `\`, nothing for current
     * directory relative, and just `\\` for UNC since the server and share
     * are rebuilt by the cleaner.
     */
    [[nodiscard]] auto normalizedPrefix() const -> std::string;

private:
    ParsedPath(std::string_view path, WinPathKind kind, std::size_t prefixLength) noexcept
        : path_(path), kind_(kind), prefixLength_(prefixLength) {}

    std::string_view path_;
    WinPathKind      kind_;
    std::size_t      prefixLength_;
};

[[nodiscard]] inline auto classify(std::string_view path) noexcept -> ParsedPath {
    return ParsedPath::parse(path);
}

} // namespace LP
