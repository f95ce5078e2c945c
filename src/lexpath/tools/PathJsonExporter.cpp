#include "tools/PathJsonExporter.hpp"

#include <lexpath/codec/Utf.hpp>
#include <lexpath/pure/PurePath.hpp>
#include <lexpath/resolve/PosixAbsolute.hpp>
#include <lexpath/windows/Clean.hpp>
#include <lexpath/windows/PathKind.hpp>
#include <lexpath/windows/WindowsPath.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string_view>

#include <nlohmann/json.hpp>

namespace LP {

namespace {

using Json = nlohmann::json;

auto absoluteKindToString(Win32Absolute::Type type) -> std::string_view {
    switch (type) {
    case Win32Absolute::Type::Drive:
        return "Drive";
    case Win32Absolute::Type::Unc:
        return "Unc";
    case Win32Absolute::Type::Device:
        return "Device";
    }
    return "Unknown";
}

auto driveToJson(char16_t drive) -> Json {
    auto text = utf16_to_utf8(std::u16string(1, drive));
    if (!text)
        return nullptr;
    return *text;
}

template <typename Style>
auto walkToJson(PathView<Style> path) -> Json {
    Json components = Json::array();
    for (auto const& cursor : path.components())
        components.push_back(std::string{cursor.str()});

    Json ancestors = Json::array();
    for (auto const& cursor : path.ancestors()) {
        ancestors.push_back(Json{{"component", std::string{cursor.str()}},
                                 {"index", cursor.index()},
                                 {"parent", std::string{cursor.parent().str()}},
                                 {"rest", std::string{cursor.rest().str()}}});
    }

    Json extensions = Json::array();
    if (auto last = path.last()) {
        for (auto const& extension : last->extensions())
            extensions.push_back(std::string{extension.extension()});
    }

    return Json{{"components", std::move(components)},
                {"ancestors", std::move(ancestors)},
                {"extensions", std::move(extensions)}};
}

auto expectedToJson(Expected<std::string> const& value) -> Json {
    if (!value)
        return Json{{"error", describeError(value.error())}};
    return *value;
}

auto describeWindowsPath(std::string const& input) -> Json {
    auto const parsed = classify(input);
    auto const kind   = parsed.kind();

    std::string subpath{parsed.subpath()};
    std::replace(subpath.begin(), subpath.end(), '/', '\\');

    Json entry{{"input", input},
               {"kind", std::string{kind.name()}},
               {"absolute", kind.isAbsolute()},
               {"legacyRelative", kind.isLegacyRelative()},
               {"prefix", std::string{parsed.prefix()}},
               {"subpath", std::string{parsed.subpath()}},
               {"prefixLength", Json{{"utf8", parsed.prefixLength()}, {"utf16", parsed.prefixUtf16Length()}}},
               {"clean", clean(input)},
               {"userPath", to_user_path(input)},
               {"built", WindowsPath::parse(input).toString()}};
    if (auto drive = kind.driveLetter())
        entry["drive"] = driveToJson(*drive);
    if (auto verbatim = split_verbatim(input)) {
        entry["verbatim"] = Json{{"kind", std::string{absoluteKindToString(verbatim->kind.type())}},
                                 {"rest", std::string{verbatim->rest}}};
    }
    entry.update(walkToJson(WindowsPathView{subpath}));
    return entry;
}

auto describePosixPath(std::string const& input) -> Json {
    Json entry{{"input", input},
               {"absolute", expectedToJson(posix_absolute(input))},
               {"lexicallyAbsolute", expectedToJson(posix_lexically_absolute(input))}};
    entry.update(walkToJson(PosixPathView{input}));
    return entry;
}

} // namespace

auto PathJsonExporter::Export(std::span<std::string const> paths, PathJsonOptions const& options)
    -> Expected<std::string> {
    bool const windows = options.style == PathJsonOptions::Style::Windows;

    Json entries = Json::array();
    for (auto const& path : paths)
        entries.push_back(windows ? describeWindowsPath(path) : describePosixPath(path));

    Json root{{"style", windows ? "windows" : "posix"}, {"paths", std::move(entries)}};
    try {
        return root.dump(options.dumpIndent);
    } catch (nlohmann::json::exception const& ex) {
        lp_log(std::string{"JSON export failed: "} + ex.what(), "Export");
        return std::unexpected(Error{Error::Code::MalformedInput, ex.what()});
    }
}

} // namespace LP
