#pragma once
#include <lexpath/pure/PurePath.hpp>
#include <lexpath/windows/PathKind.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace LP {

/**
 * An owned Windows path built up one component at a time: a normalized
 * prefix (separators are `\`, absolute prefixes end in `\`) followed by a
 * WindowsPathBuf. Unlike clean(), `.` and `..` are applied as they are
 * pushed, so `..` can only pop what has already been pushed.
 *
 * Verbatim paths are kept exactly as given; pushing onto one appends the
 * text without interpretation.
 */
class WindowsPath {
public:
    WindowsPath() = default;

    [[nodiscard]] static auto parse(std::string_view path) -> WindowsPath;

    /**
     * Push one component, or several when `component` contains separators.
     * `.` drops an empty trailing file name, `..` does that and then pops a
     * component. Anything else has its trailing dots and spaces trimmed.
     *
     * @return true if any trimming happened.
     */
    auto push(std::string_view component) -> bool;
    auto pop() -> bool;
    // Drops every component; the prefix stays.
    auto clear() noexcept -> void { path_.clear(); }

    [[nodiscard]] auto kind() const noexcept -> WinPathKind { return kind_; }
    [[nodiscard]] auto isVerbatim() const noexcept -> bool { return kind_.type() == WinPathKind::Type::Verbatim; }
    [[nodiscard]] auto prefix() const noexcept -> std::string const& { return prefix_; }
    [[nodiscard]] auto subpath() const noexcept -> WindowsPathView { return path_.view(); }
    [[nodiscard]] auto toString() const -> std::string { return prefix_ + path_.str(); }

    friend auto operator<<(std::ostream& os, WindowsPath const& path) -> std::ostream& {
        return os << path.prefix_ << path.path_.str();
    }

private:
    WindowsPath(WinPathKind kind, std::string prefix) : prefix_(std::move(prefix)), kind_(kind) {}

    auto pushOne(std::string_view name) -> bool;
    auto dropEmptyFileName() -> void;

    std::string    prefix_;
    WindowsPathBuf path_;
    WinPathKind    kind_ = WinPathKind::currentDirectoryRelative();
};

} // namespace LP
