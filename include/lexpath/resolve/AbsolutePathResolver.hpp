#pragma once
#include <lexpath/core/Error.hpp>

#include <string>
#include <string_view>

namespace LP {

/**
 * Resolves a non-verbatim Windows path against whatever current directory
 * and per-drive state the operating system keeps. Inputs are already
 * separator-normalized UTF-16 and never contain a null. May block.
 */
class AbsolutePathResolver {
public:
    virtual ~AbsolutePathResolver() = default;

    virtual auto absolutize(std::u16string_view path) -> Expected<std::u16string> = 0;
};

#ifdef _WIN32
// Backed by GetFullPathNameW.
class Win32FullPathResolver final : public AbsolutePathResolver {
public:
    auto absolutize(std::u16string_view path) -> Expected<std::u16string> override;
};
#endif

} // namespace LP
