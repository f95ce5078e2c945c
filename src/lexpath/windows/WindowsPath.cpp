#include <lexpath/windows/WindowsPath.hpp>

#include <lexpath/windows/Clean.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace {

constexpr auto is_separator(char c) noexcept -> bool {
    return c == '\\' || c == '/';
}

// Calls `fn` for every piece between separators, empty pieces included.
template <typename Fn>
auto for_each_piece(std::string_view text, Fn&& fn) -> void {
    auto begin = text.begin();
    while (true) {
        auto end = std::find_if(begin, text.end(), is_separator);
        fn(std::string_view{begin, end});
        if (end == text.end())
            return;
        begin = end + 1;
    }
}

} // namespace

namespace LP {

auto WindowsPath::parse(std::string_view path) -> WindowsPath {
    auto const parsed = classify(path);
    auto const kind   = parsed.kind();

    if (kind.type() == WinPathKind::Type::Verbatim) {
        WindowsPath result{kind, std::string{parsed.prefix()}};
        result.path_ = WindowsPathBuf::fromStringUnchecked(std::string{parsed.subpath()});
        return result;
    }

    std::string prefix;
    if (kind.type() == WinPathKind::Type::Unc) {
        prefix = std::string{parsed.prefix()};
        std::replace(prefix.begin(), prefix.end(), '/', '\\');
        if (prefix.back() != '\\')
            prefix.push_back('\\');
    } else {
        prefix = parsed.normalizedPrefix();
    }
    WindowsPath result{kind, std::move(prefix)};

    auto const subpath     = parsed.subpath();
    auto const lastBegin   = std::find_if(subpath.rbegin(), subpath.rend(), is_separator).base();
    auto const directories = std::string_view{subpath.begin(), lastBegin};
    if (!directories.empty()) {
        for_each_piece(directories.substr(0, directories.size() - 1),
                       [&](std::string_view piece) { result.pushOne(trim_single_dot(piece)); });
    }
    if (!subpath.empty())
        result.pushOne(std::string_view{lastBegin, subpath.end()});
    return result;
}

auto WindowsPath::push(std::string_view component) -> bool {
    bool trimmed = false;
    if (this->isVerbatim()) {
        path_.push(WindowsComponent::fromUnchecked(component));
        return trimmed;
    }
    for_each_piece(component, [&](std::string_view piece) { trimmed |= this->pushOne(piece); });
    return trimmed;
}

auto WindowsPath::pop() -> bool {
    return path_.pop();
}

auto WindowsPath::dropEmptyFileName() -> void {
    if (!path_.empty() && path_.isFileNameEmpty())
        path_.pop();
}

auto WindowsPath::pushOne(std::string_view name) -> bool {
    if (name == ".") {
        this->dropEmptyFileName();
        return false;
    }
    if (name == "..") {
        this->dropEmptyFileName();
        if (!path_.pop())
            lp_log("Dropping '..' at the start of " + this->toString(), "Builder");
        return false;
    }

    auto const trimmed = trim_filename(name);
    path_.push(WindowsComponent::fromUnchecked(trimmed));
    if (trimmed.size() == name.size())
        return false;
    lp_log("Trimmed component '" + std::string{name} + "' to '" + std::string{trimmed} + "'", "Builder");
    return true;
}

} // namespace LP
