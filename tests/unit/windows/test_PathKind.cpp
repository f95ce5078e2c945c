#include <lexpath/windows/PathKind.hpp>

#include <doctest/doctest.h>

#include <string>

using namespace LP;

namespace {

auto kindOf(std::string_view path) -> WinPathKind {
    return WinPathKind::fromString(path);
}

} // namespace

TEST_SUITE("windows.pathkind") {
    TEST_CASE("Classification in priority order") {
        CHECK(kindOf("") == WinPathKind::currentDirectoryRelative());
        CHECK(kindOf(R"(\\?\C:\x)") == WinPathKind::verbatim());
        CHECK(kindOf(R"(\\?\)") == WinPathKind::verbatim());
        CHECK(kindOf(R"(\\.\COM1)") == WinPathKind::device());
        CHECK(kindOf(R"(\\server\share\x)") == WinPathKind::unc());
        CHECK(kindOf(R"(\file)") == WinPathKind::rootRelative());
        CHECK(kindOf(R"(C:\file)") == WinPathKind::drive(u'C'));
        CHECK(kindOf("C:/file") == WinPathKind::drive(u'C'));
        CHECK(kindOf("C:file") == WinPathKind::driveRelative(u'C'));
        CHECK(kindOf("C:") == WinPathKind::driveRelative(u'C'));
        CHECK(kindOf("file") == WinPathKind::currentDirectoryRelative());
        CHECK(kindOf(".") == WinPathKind::currentDirectoryRelative());
    }

    TEST_CASE("Verbatim needs the exact prefix") {
        CHECK(kindOf("//?/C:/x") == WinPathKind::device());
        CHECK(kindOf(R"(\\?/C:\x)") == WinPathKind::device());
        CHECK(kindOf(R"(/\?\C:\x)") == WinPathKind::device());
    }

    TEST_CASE("Device versus UNC") {
        CHECK(kindOf("//./pipe/x") == WinPathKind::device());
        CHECK(kindOf(R"(\\.)") == WinPathKind::unc());
        CHECK(kindOf(R"(\\.x)") == WinPathKind::unc());
        CHECK(kindOf(R"(\\)") == WinPathKind::unc());
        CHECK(kindOf("/") == WinPathKind::rootRelative());
    }

    TEST_CASE("Any first byte can be a drive") {
        CHECK(kindOf("1:\\") == WinPathKind::drive(u'1'));
        CHECK(kindOf("c:") == WinPathKind::driveRelative(u'c'));
        CHECK(kindOf("C:x:") == WinPathKind::driveRelative(u'C'));
    }

    TEST_CASE("Non-ASCII drive letters") {
        auto [two, twoLength] = WinPathKind::fromStringWithLength("\xC3\xA9:\\x");
        CHECK(two == WinPathKind::drive(u'\u00E9'));
        CHECK(twoLength == 4);
        CHECK(two.utf8Length() == 4);
        CHECK(two.utf16Length() == 3);

        auto [three, threeLength] = WinPathKind::fromStringWithLength("\xE2\x82\xAC:x");
        CHECK(three == WinPathKind::driveRelative(u'\u20AC'));
        CHECK(threeLength == 4);
        CHECK(three.utf8Length() == 4);

        CHECK(kindOf("\xC3\xA9x") == WinPathKind::currentDirectoryRelative());
        // Astral scalars and stray continuation bytes cannot be drives.
        CHECK(kindOf("\xF0\x9F\x98\x80:\\") == WinPathKind::currentDirectoryRelative());
        CHECK(kindOf("\x80:\\") == WinPathKind::currentDirectoryRelative());
        // Truncated sequence.
        CHECK(kindOf("\xE2\x82") == WinPathKind::currentDirectoryRelative());
    }

    TEST_CASE("Malformed drive letters are not drives") {
        // Overlong encodings of NUL and '/'.
        auto [overlong, overlongLength] = WinPathKind::fromStringWithLength("\xC0\x80:\\");
        CHECK(overlong == WinPathKind::currentDirectoryRelative());
        CHECK(overlongLength == 0);
        CHECK(kindOf("\xC1\xAF:x") == WinPathKind::currentDirectoryRelative());
        CHECK(kindOf("\xE0\x80\x80:\\") == WinPathKind::currentDirectoryRelative());
        // Lead byte without its continuation.
        CHECK(kindOf("\xC3:\\x") == WinPathKind::currentDirectoryRelative());
        // Encoded surrogate.
        CHECK(kindOf("\xED\xA0\x80:\\") == WinPathKind::currentDirectoryRelative());

        auto const parsed = classify("\xC0\x80:\\a");
        CHECK(parsed.prefix().empty());
        CHECK(parsed.subpath() == "\xC0\x80:\\a");

        auto verbatim = split_verbatim("\\\\?\\\xC0\x80:\\x");
        REQUIRE(verbatim.has_value());
        CHECK(verbatim->kind == Win32Absolute::device());
    }

    TEST_CASE("Prefix lengths") {
        CHECK(WinPathKind::fromStringWithLength(R"(C:\x)").second == 3);
        CHECK(WinPathKind::fromStringWithLength("C:x").second == 2);
        CHECK(WinPathKind::fromStringWithLength(R"(\\server\share)").second == 2);
        CHECK(WinPathKind::fromStringWithLength(R"(\\.\x)").second == 4);
        CHECK(WinPathKind::fromStringWithLength(R"(\\?\x)").second == 4);
        CHECK(WinPathKind::fromStringWithLength(R"(\x)").second == 1);
        CHECK(WinPathKind::fromStringWithLength("x").second == 0);

        auto [kind, rest] = WinPathKind::split(R"(C:\a\b)");
        CHECK(kind == WinPathKind::drive(u'C'));
        CHECK(rest == R"(a\b)");
    }

    TEST_CASE("Kind predicates") {
        CHECK(WinPathKind::drive(u'C').isAbsolute());
        CHECK(WinPathKind::unc().isAbsolute());
        CHECK(WinPathKind::device().isAbsolute());
        CHECK(WinPathKind::verbatim().isAbsolute());
        CHECK_FALSE(WinPathKind::rootRelative().isAbsolute());
        CHECK_FALSE(WinPathKind::driveRelative(u'C').isAbsolute());
        CHECK_FALSE(WinPathKind::currentDirectoryRelative().isAbsolute());

        CHECK(WinPathKind::rootRelative().isLegacyRelative());
        CHECK(WinPathKind::driveRelative(u'D').isLegacyRelative());
        CHECK_FALSE(WinPathKind::currentDirectoryRelative().isLegacyRelative());

        CHECK(WinPathKind::drive(u'C').driveLetter() == u'C');
        CHECK_FALSE(WinPathKind::unc().driveLetter().has_value());
        CHECK(WinPathKind::drive(u'C') != WinPathKind::drive(u'D'));
        CHECK(WinPathKind::unc().name() == "Unc");
    }

    TEST_CASE("Relative and absolute views of a kind") {
        CHECK(WinPathKind::currentDirectoryRelative().asRelative() == Win32Relative::currentDirectory());
        CHECK(WinPathKind::driveRelative(u'D').asRelative() == Win32Relative::driveRelative(u'D'));
        CHECK(WinPathKind::rootRelative().asRelative() == Win32Relative::root());
        CHECK_FALSE(WinPathKind::drive(u'C').asRelative().has_value());
        CHECK(Win32Relative::root().isLegacyRelative());
        CHECK_FALSE(Win32Relative::currentDirectory().isLegacyRelative());

        CHECK(Win32Absolute::fromKind(WinPathKind::drive(u'C')) == Win32Absolute::drive(u'C'));
        CHECK(Win32Absolute::fromKind(WinPathKind::unc()) == Win32Absolute::unc());
        CHECK(Win32Absolute::fromKind(WinPathKind::device()) == Win32Absolute::device());
        CHECK_FALSE(Win32Absolute::fromKind(WinPathKind::verbatim()).has_value());
        CHECK_FALSE(Win32Absolute::fromKind(WinPathKind::rootRelative()).has_value());
    }

    TEST_CASE("UNC full prefix") {
        auto parsed = classify(R"(\\server\share\x)");
        CHECK(parsed.kind() == WinPathKind::unc());
        CHECK(parsed.prefix() == R"(\\server\share\)");
        CHECK(parsed.subpath() == "x");
        CHECK(parsed.prefixUtf16Length() == 15);

        SUBCASE("Mixed separators") {
            auto mixed = classify("//server/share/x/y");
            CHECK(mixed.prefix() == "//server/share/");
            CHECK(mixed.subpath() == "x/y");
        }
        SUBCASE("Missing share runs to the end") {
            CHECK(classify(R"(\\server)").prefix() == R"(\\server)");
            CHECK(classify(R"(\\server\share)").prefix() == R"(\\server\share)");
            CHECK(classify(R"(\\server\share)").subpath().empty());
        }
        SUBCASE("Non-ASCII server counts UTF-16 units") {
            auto wide = classify("\\\\s\xC3\xA9rver\\share\\x");
            CHECK(wide.prefixLength() == 16);
            CHECK(wide.prefixUtf16Length() == 15);
        }
    }

    TEST_CASE("Prefix and subpath cover the path") {
        for (auto text : {R"(C:\a\b)", "C:a", R"(\\s\h\x)", R"(\\.\COM1)", R"(\\?\C:\x)", R"(\a)", "a\\b", ""}) {
            CAPTURE(text);
            auto parsed = classify(text);
            CHECK(std::string{parsed.prefix()} + std::string{parsed.subpath()} == text);
            auto [prefix, subpath] = parsed.parts();
            CHECK(prefix.size() == parsed.prefixLength());
            CHECK(subpath == parsed.subpath());
        }
    }

    TEST_CASE("Normalized prefixes") {
        CHECK(classify("C:/x").normalizedPrefix() == R"(C:\)");
        CHECK(classify("C:x").normalizedPrefix() == "C:");
        CHECK(classify("//./x").normalizedPrefix() == R"(\\.\)");
        CHECK(classify("//?/x").normalizedPrefix() == R"(\\?\)");
        CHECK(classify(R"(\\?\x)").normalizedPrefix() == R"(\\?\)");
        CHECK(classify("/x").normalizedPrefix() == R"(\)");
        CHECK(classify("//s/h/x").normalizedPrefix() == R"(\\)");
        CHECK(classify("x").normalizedPrefix().empty());
    }

    TEST_CASE("Splitting verbatim paths") {
        CHECK_FALSE(split_verbatim(R"(C:\x)").has_value());
        CHECK_FALSE(is_verbatim("//?/C:/x"));
        CHECK(is_verbatim(R"(\\?\C:\x)"));

        auto drive = split_verbatim(R"(\\?\C:\x)");
        REQUIRE(drive.has_value());
        CHECK(drive->kind == Win32Absolute::drive(u'C'));
        CHECK(drive->rest == R"(C:\x)");

        auto bareDrive = split_verbatim(R"(\\?\C:)");
        REQUIRE(bareDrive.has_value());
        CHECK(bareDrive->kind == Win32Absolute::drive(u'C'));

        auto wideDrive = split_verbatim("\\\\?\\\xC3\xA9:\\x");
        REQUIRE(wideDrive.has_value());
        CHECK(wideDrive->kind == Win32Absolute::drive(u'\u00E9'));

        auto unc = split_verbatim(R"(\\?\UNC\server\share)");
        REQUIRE(unc.has_value());
        CHECK(unc->kind == Win32Absolute::unc());
        CHECK(unc->rest == R"(\server\share)");

        auto bareUnc = split_verbatim(R"(\\?\UNC)");
        REQUIRE(bareUnc.has_value());
        CHECK(bareUnc->kind == Win32Absolute::unc());
        CHECK(bareUnc->rest.empty());

        auto device = split_verbatim(R"(\\?\COM1)");
        REQUIRE(device.has_value());
        CHECK(device->kind == Win32Absolute::device());
        CHECK(device->rest == "COM1");

        // `UNCx` and `C:x` are not the forms above.
        CHECK(split_verbatim(R"(\\?\UNCx)")->kind == Win32Absolute::device());
        CHECK(split_verbatim(R"(\\?\C:x)")->kind == Win32Absolute::device());
    }
}
