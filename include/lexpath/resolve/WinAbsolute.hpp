#pragma once
#include <lexpath/core/Error.hpp>
#include <lexpath/resolve/AbsolutePathResolver.hpp>
#include <lexpath/windows/PathKind.hpp>

#include <string>
#include <string_view>

namespace LP {

/**
 * Make a Windows path absolute through `resolver`. Empty input gives an
 * empty result and verbatim paths come back unchanged, neither calling the
 * resolver. Paths with an embedded null fail with EmbeddedNull before the
 * resolver is reached.
 */
[[nodiscard]] auto win_absolute(std::string_view path, AbsolutePathResolver& resolver) -> Expected<std::string>;

// The absolute directory a relative kind is resolved against: `.\`, `\` or `X:`.
[[nodiscard]] auto win_resolve_prefix(Win32Relative relative, AbsolutePathResolver& resolver)
    -> Expected<std::string>;

} // namespace LP
