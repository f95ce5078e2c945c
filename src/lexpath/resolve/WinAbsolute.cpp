#include <lexpath/resolve/WinAbsolute.hpp>

#include <lexpath/codec/Utf.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace LP {

namespace {

auto resolve_wide(std::u16string_view wide, AbsolutePathResolver& resolver) -> Expected<std::string> {
    auto resolved = resolver.absolutize(wide);
    if (!resolved) {
        lp_log("Resolver failed: " + describeError(resolved.error()), "Resolve");
        return std::unexpected(resolved.error());
    }
    return utf16_to_utf8(*resolved);
}

} // namespace

auto win_absolute(std::string_view path, AbsolutePathResolver& resolver) -> Expected<std::string> {
    if (path.empty())
        return std::string{};
    if (is_verbatim(path))
        return std::string{path};
    if (path.find('\0') != std::string_view::npos)
        return std::unexpected(Error{Error::Code::EmbeddedNull, "path contains an embedded null"});

    std::string normalized{path};
    std::replace(normalized.begin(), normalized.end(), '/', '\\');
    auto wide = utf8_to_utf16(normalized);
    if (!wide)
        return std::unexpected(wide.error());
    return resolve_wide(*wide, resolver);
}

auto win_resolve_prefix(Win32Relative relative, AbsolutePathResolver& resolver) -> Expected<std::string> {
    std::u16string prefix;
    switch (relative.type()) {
    case Win32Relative::Type::CurrentDirectory:
        prefix = u".\\";
        break;
    case Win32Relative::Type::Root:
        prefix = u"\\";
        break;
    case Win32Relative::Type::DriveRelative:
        prefix.push_back(relative.drive());
        prefix.push_back(u':');
        break;
    }
    return resolve_wide(prefix, resolver);
}

} // namespace LP
