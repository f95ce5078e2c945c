#include <lexpath/windows/Clean.hpp>

#include <lexpath/codec/Utf.hpp>
#include <lexpath/pure/PurePath.hpp>
#include <lexpath/windows/PathKind.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <vector>

namespace {

constexpr auto is_separator(char c) noexcept -> bool {
    return c == '\\' || c == '/';
}

// Rebuild `\\server\share\` from a (possibly broken) UNC prefix.
auto rebuild_unc_prefix(std::string_view prefix, bool hasBody) -> std::string {
    auto const rest        = prefix.substr(2);
    auto const serverEnd   = std::find_if(rest.begin(), rest.end(), is_separator);
    auto const server      = std::string_view{rest.begin(), serverEnd};
    std::string_view share;
    bool             trailing = false;
    if (serverEnd != rest.end()) {
        auto const shareEnd = std::find_if(serverEnd + 1, rest.end(), is_separator);
        share               = std::string_view{serverEnd + 1, shareEnd};
        trailing            = shareEnd != rest.end();
    }
    // A share that ends the path would lose its dots and spaces to the final trim.
    if (!trailing)
        share = LP::trim_filename(share);

    std::string out{R"(\\)"};
    out.append(server);
    if (!share.empty()) {
        out.push_back('\\');
        out.append(share);
        if (trailing)
            out.push_back('\\');
    } else {
        lp_log("UNC path without share: " + std::string{prefix}, "Clean");
        if (hasBody)
            out.push_back('\\');
    }
    return out;
}

} // namespace

namespace LP {

auto trim_single_dot(std::string_view name) noexcept -> std::string_view {
    if (name != "." && name.ends_with('.') && !name.ends_with(".."))
        name.remove_suffix(1);
    return name;
}

auto trim_filename(std::string_view name) noexcept -> std::string_view {
    if (name == "." || name == "..")
        return name;
    auto const last = name.find_last_not_of(". ");
    if (last == std::string_view::npos)
        return {};
    return name.substr(0, last + 1);
}

auto trim_full_path(std::string_view path) noexcept -> std::string_view {
    auto const last = path.find_last_not_of(". ");
    if (last == std::string_view::npos)
        return path;

    auto const kept      = path.substr(0, last + 1);
    auto const remainder = path.substr(last + 1);
    if (remainder == "." || remainder == "..") {
        if (is_separator(kept.back()) || kept.size() <= classify(path).prefixLength())
            return path;
    }
    return kept;
}

auto clean(std::string_view path) -> std::string {
    auto const parsed = classify(path);
    auto const kind   = parsed.kind();
    if (kind.type() == WinPathKind::Type::Verbatim)
        return std::string{path};

    std::string subpath{parsed.subpath()};
    std::replace(subpath.begin(), subpath.end(), '/', '\\');

    // Walk back to front so `..` only has to count what it cancels.
    std::vector<std::string_view> reversed;
    std::size_t                   skip = 0;
    if (!subpath.empty() && subpath.back() == '\\')
        reversed.emplace_back();
    for (auto const& cursor : WindowsPathView{subpath}.ancestors()) {
        auto const name = cursor.str();
        if (name.empty() || name == ".")
            continue;
        if (name == "..") {
            ++skip;
            continue;
        }
        if (skip > 0) {
            --skip;
            continue;
        }
        reversed.push_back(trim_single_dot(name));
    }
    if (skip > 0 && !kind.isAbsolute() && kind.type() != WinPathKind::Type::RootRelative)
        reversed.insert(reversed.end(), skip, std::string_view{".."});

    std::string body;
    for (auto it = reversed.rbegin(); it != reversed.rend(); ++it) {
        if (it != reversed.rbegin())
            body.push_back('\\');
        body.append(*it);
    }

    auto result = kind.type() == WinPathKind::Type::Unc ? rebuild_unc_prefix(parsed.prefix(), !body.empty())
                                                        : parsed.normalizedPrefix();
    result.append(body);
    result.resize(trim_full_path(result).size());
    return result;
}

auto is_component_win32_safe(std::string_view component) noexcept -> bool {
    if (component.empty() || component.ends_with('.') || component.ends_with(' '))
        return false;
    return component.find_first_of(std::string_view{"/\0", 2}) == std::string_view::npos;
}

auto is_win32_safe(std::string_view path) noexcept -> bool {
    if (path.ends_with('\\'))
        path.remove_suffix(1);
    for (auto const& cursor : WindowsPathView{path}.components()) {
        if (!is_component_win32_safe(cursor.str()))
            return false;
    }
    return !path.empty();
}

auto to_user_path(std::string_view path) -> std::string {
    auto const parts = split_verbatim(path);
    if (!parts)
        return std::string{path};

    std::string      candidate;
    std::string_view checked = parts->rest;
    switch (parts->kind.type()) {
    case Win32Absolute::Type::Drive: {
        candidate         = std::string{parts->rest};
        auto const prefix = utf8_width(parts->kind.drive()) + 2;
        checked           = parts->rest.substr(std::min(prefix, parts->rest.size()));
        break;
    }
    case Win32Absolute::Type::Unc:
        candidate = parts->rest.empty() ? std::string{R"(\\)"} : std::string{R"(\)"} + std::string{parts->rest};
        if (!checked.empty())
            checked.remove_prefix(1);
        break;
    case Win32Absolute::Type::Device:
        candidate = std::string{R"(\\.\)"} + std::string{parts->rest};
        break;
    }

    auto const kind = classify(candidate).kind();
    auto const safe = (checked.empty() || is_win32_safe(checked)) && kind.isAbsolute()
                      && kind.type() != WinPathKind::Type::Verbatim && clean(candidate) == candidate;
    if (!safe) {
        lp_log("Keeping verbatim path: " + std::string{path}, "Clean");
        return std::string{path};
    }
    return candidate;
}

} // namespace LP
