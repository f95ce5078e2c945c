#include <lexpath/windows/WindowsPath.hpp>

#include <doctest/doctest.h>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace LP;

TEST_SUITE("windows.builder") {
    TEST_CASE("Parse splits into a normalized prefix and a path") {
        auto path = WindowsPath::parse(R"(C:\path\to\file)");
        CHECK(path.kind() == WinPathKind::drive(u'C'));
        CHECK(path.prefix() == R"(C:\)");
        CHECK(path.subpath().str() == R"(path\to\file)");
        CHECK(path.toString() == R"(C:\path\to\file)");
    }

    TEST_CASE("Parse applies dots as it goes") {
        std::vector<std::pair<std::string, std::string>> cases{
            {"C:/a/./b/../c", R"(C:\a\c)"},
            {R"(C:\a\b\)", R"(C:\a\b\)"},
            {R"(C:\a\b\.)", R"(C:\a\b)"},
            {R"(C:\a\b\..)", R"(C:\a)"},
            {R"(C:\a\file. .)", R"(C:\a\file)"},
            {R"(C:\a.\b)", R"(C:\a\b)"},
            {R"(C:\a\\b)", R"(C:\a\b)"},
            {R"(C:\a\..\..\b)", R"(C:\b)"},
            {"C:x", "C:x"},
            {"/x/y/", R"(\x\y\)"},
            {"a/b", R"(a\b)"},
            {R"(..\x)", "x"},
            {"//./COM1", R"(\\.\COM1)"},
            {R"(\\server\share\x)", R"(\\server\share\x)"},
            {"//server/share", R"(\\server\share\)"},
            {"", ""},
        };
        for (auto const& [input, expected] : cases) {
            CAPTURE(input);
            CHECK(WindowsPath::parse(input).toString() == expected);
        }
    }

    TEST_CASE("UNC prefixes keep server and share") {
        auto path = WindowsPath::parse("//server/share/dir/file");
        CHECK(path.kind() == WinPathKind::unc());
        CHECK(path.prefix() == R"(\\server\share\)");
        CHECK(path.subpath().str() == R"(dir\file)");
    }

    TEST_CASE("Verbatim paths are kept as given") {
        auto path = WindowsPath::parse(R"(\\?\C:\a\..\b.)");
        CHECK(path.isVerbatim());
        CHECK(path.prefix() == R"(\\?\)");
        CHECK(path.toString() == R"(\\?\C:\a\..\b.)");

        CHECK_FALSE(path.push("c."));
        CHECK(path.toString() == R"(\\?\C:\a\..\b.\c.)");
    }

    TEST_CASE("Push") {
        auto path = WindowsPath::parse(R"(C:\a)");

        SUBCASE("Plain component") {
            CHECK_FALSE(path.push("b"));
            CHECK(path.toString() == R"(C:\a\b)");
        }
        SUBCASE("Trailing dots and spaces are trimmed and reported") {
            CHECK(path.push("c. "));
            CHECK(path.toString() == R"(C:\a\c)");
        }
        SUBCASE("Empty component leaves a file name slot") {
            CHECK_FALSE(path.push(""));
            CHECK(path.toString() == R"(C:\a\)");
            CHECK_FALSE(path.push("."));
            CHECK(path.toString() == R"(C:\a)");
        }
        SUBCASE("Parent pops") {
            path.push("b");
            path.push("");
            CHECK_FALSE(path.push(".."));
            CHECK(path.toString() == R"(C:\a)");
            path.push("..");
            CHECK(path.toString() == R"(C:\)");
            // Nothing left to pop.
            path.push("..");
            CHECK(path.toString() == R"(C:\)");
        }
        SUBCASE("Separators inside the argument") {
            CHECK_FALSE(path.push("x/y\\z"));
            CHECK(path.toString() == R"(C:\a\x\y\z)");
            CHECK(path.push("q./r"));
            CHECK(path.toString() == R"(C:\a\x\y\z\q\r)");
        }
        SUBCASE("All dots trims to nothing") {
            CHECK(path.push("..."));
            CHECK(path.toString() == R"(C:\a\)");
        }
    }

    TEST_CASE("Pop and clear") {
        auto path = WindowsPath::parse(R"(C:\a\b\)");
        CHECK(path.pop());
        CHECK(path.toString() == R"(C:\a\b)");
        CHECK(path.pop());
        CHECK(path.pop());
        CHECK(path.toString() == R"(C:\)");
        CHECK_FALSE(path.pop());

        auto other = WindowsPath::parse(R"(\\server\share\x\y)");
        other.clear();
        CHECK(other.toString() == R"(\\server\share\)");
        CHECK(other.subpath().empty());
    }

    TEST_CASE("Default and streaming") {
        WindowsPath path;
        CHECK(path.kind() == WinPathKind::currentDirectoryRelative());
        CHECK(path.toString().empty());
        path.push("dir");
        path.push("file.txt");

        std::ostringstream os;
        os << path;
        CHECK(os.str() == R"(dir\file.txt)");
    }
}
