#include <lexpath/resolve/PosixAbsolute.hpp>

#include <lexpath/pure/PurePath.hpp>

#include "log/TaggedLogger.hpp"

#include <filesystem>
#include <system_error>

namespace LP {

namespace {

auto current_directory() -> Expected<std::string> {
    std::error_code ec;
    auto            cwd = std::filesystem::current_path(ec);
    if (ec) {
        lp_log("current_path failed: " + ec.message(), "Resolve");
        return std::unexpected(Error{Error::Code::OsError, ec.message()});
    }
    return cwd.string();
}

auto join_absolute(std::string_view path, std::string_view base, bool lexical) -> Expected<std::string> {
    if (path.find('\0') != std::string_view::npos)
        return std::unexpected(Error{Error::Code::EmbeddedNull, "path contains an embedded null"});

    std::string combined;
    if (path.starts_with('/')) {
        combined = std::string{path};
    } else {
        combined = std::string{base};
        combined.push_back('/');
        combined.append(path);
    }

    // POSIX leaves `//` implementation defined, three or more mean `/`.
    std::string_view root = "/";
    if (combined.starts_with("//") && !combined.starts_with("///"))
        root = "//";

    PosixPathBuf body;
    for (auto const& cursor : PosixPathView{combined}.components()) {
        auto const name = cursor.str();
        if (name.empty() || name == ".")
            continue;
        if (lexical && name == "..") {
            // At the root `..` is the root itself.
            (void)body.pop();
            continue;
        }
        body.push(PosixComponent::fromUnchecked(name));
    }

    std::string result{root};
    result.append(body.str());
    if (!body.empty() && path.ends_with('/'))
        result.push_back('/');
    return result;
}

auto require_absolute(std::string_view base) -> Expected<void> {
    if (!base.starts_with('/'))
        return std::unexpected(Error{Error::Code::NotAbsolute, "base path is not absolute: " + std::string{base}});
    return {};
}

} // namespace

auto posix_absolute(std::string_view path) -> Expected<std::string> {
    if (path.starts_with('/'))
        return join_absolute(path, {}, false);
    auto cwd = current_directory();
    if (!cwd)
        return std::unexpected(cwd.error());
    return join_absolute(path, *cwd, false);
}

auto posix_absolute_from(std::string_view path, std::string_view base) -> Expected<std::string> {
    if (auto ok = require_absolute(base); !ok)
        return std::unexpected(ok.error());
    return join_absolute(path, base, false);
}

auto posix_lexically_absolute(std::string_view path) -> Expected<std::string> {
    if (path.starts_with('/'))
        return join_absolute(path, {}, true);
    auto cwd = current_directory();
    if (!cwd)
        return std::unexpected(cwd.error());
    return join_absolute(path, *cwd, true);
}

auto posix_lexically_absolute_from(std::string_view path, std::string_view base) -> Expected<std::string> {
    if (auto ok = require_absolute(base); !ok)
        return std::unexpected(ok.error());
    return join_absolute(path, base, true);
}

} // namespace LP
