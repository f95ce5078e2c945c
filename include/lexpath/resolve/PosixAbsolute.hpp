#pragma once
#include <lexpath/core/Error.hpp>

#include <string>
#include <string_view>

namespace LP {

/**
 * Join `path` to the current directory (or `base`) unless it is already
 * absolute. Repeated separators and `.` components go away, `..` is kept,
 * a leading `//` (but not `///`) and a trailing `/` survive.
 */
[[nodiscard]] auto posix_absolute(std::string_view path) -> Expected<std::string>;
[[nodiscard]] auto posix_absolute_from(std::string_view path, std::string_view base) -> Expected<std::string>;

// As above, but `..` pops the previous component and stops at the root.
[[nodiscard]] auto posix_lexically_absolute(std::string_view path) -> Expected<std::string>;
[[nodiscard]] auto posix_lexically_absolute_from(std::string_view path, std::string_view base)
    -> Expected<std::string>;

} // namespace LP
