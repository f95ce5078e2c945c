#pragma once
#include <string>
#include <string_view>

namespace LP {

/**
 * Lexically normalize a Windows path the way the Win32 layer would before
 * handing it to the kernel: separators become `\`, `.` and empty
 * components disappear, `..` cancels the component before it (never above
 * an absolute root), a single trailing dot is dropped from each component
 * and trailing dots and spaces are trimmed from the whole path.
 *
 * Verbatim (`\\?\`) paths are returned unchanged. Never fails and touches
 * no external state. `clean(clean(p)) == clean(p)`.
 */
[[nodiscard]] auto clean(std::string_view path) -> std::string;

/**
 * Trim trailing dots and spaces from a whole path. A trailing `.` or `..`
 * that is a complete component (right after a separator or the prefix) is
 * kept, as is a path made only of dots and spaces.
 */
[[nodiscard]] auto trim_full_path(std::string_view path) noexcept -> std::string_view;

// Trim trailing dots and spaces from one file name; `.` and `..` are left alone.
[[nodiscard]] auto trim_filename(std::string_view name) noexcept -> std::string_view;

// Drop one trailing dot unless the name is `.` or ends in `..`.
[[nodiscard]] auto trim_single_dot(std::string_view name) noexcept -> std::string_view;

// False for names Win32 would silently alter or reject.
[[nodiscard]] auto is_component_win32_safe(std::string_view component) noexcept -> bool;

// Every `\` separated component must be safe; one trailing `\` is allowed.
[[nodiscard]] auto is_win32_safe(std::string_view path) noexcept -> bool;

/**
 * Turn a verbatim path into the form a user would type (`\\?\C:\x` to
 * `C:\x`, `\\?\UNC\s\x` to `\\s\x`, `\\?\COM1` to `\\.\COM1`). The
 * verbatim text is returned unchanged whenever dropping `\\?\` would
 * change which file the path names. Non-verbatim paths pass through.
 */
[[nodiscard]] auto to_user_path(std::string_view path) -> std::string;

} // namespace LP
