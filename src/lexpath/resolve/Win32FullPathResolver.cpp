#ifdef _WIN32
#include <lexpath/resolve/AbsolutePathResolver.hpp>

#include <windows.h>

#include <string>

namespace LP {

auto Win32FullPathResolver::absolutize(std::u16string_view path) -> Expected<std::u16string> {
    static_assert(sizeof(wchar_t) == sizeof(char16_t));

    std::u16string const input{path};
    auto const*          in = reinterpret_cast<wchar_t const*>(input.c_str());

    std::u16string buffer(MAX_PATH, u'\0');
    while (true) {
        auto const length = ::GetFullPathNameW(in, static_cast<DWORD>(buffer.size()),
                                               reinterpret_cast<wchar_t*>(buffer.data()), nullptr);
        if (length == 0)
            return std::unexpected(
                Error{Error::Code::OsError, "GetFullPathNameW failed with error " + std::to_string(::GetLastError())});
        // On success the length excludes the terminator, otherwise it is the size needed including it.
        if (length < buffer.size()) {
            buffer.resize(length);
            return buffer;
        }
        buffer.resize(length);
    }
}

} // namespace LP
#endif
