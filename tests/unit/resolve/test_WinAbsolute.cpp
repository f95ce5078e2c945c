#include <lexpath/resolve/WinAbsolute.hpp>

#include <doctest/doctest.h>

#include <optional>
#include <string>
#include <vector>

using namespace LP;

namespace {

// Joins relative input onto a fixed directory and records every call.
class FakeResolver final : public AbsolutePathResolver {
public:
    auto absolutize(std::u16string_view path) -> Expected<std::u16string> override {
        calls.emplace_back(path);
        if (failure)
            return std::unexpected(*failure);
        if (path.size() >= 2 && path[1] == u':')
            return std::u16string{path};
        return std::u16string{uR"(C:\work\)"} + std::u16string{path};
    }

    std::vector<std::u16string> calls;
    std::optional<Error>        failure;
};

} // namespace

TEST_SUITE("resolve.windows") {
    TEST_CASE("Relative paths go through the resolver") {
        FakeResolver resolver;
        auto         result = win_absolute("dir/file", resolver);
        REQUIRE(result.has_value());
        CHECK(*result == R"(C:\work\dir\file)");
        REQUIRE(resolver.calls.size() == 1);
        // Separators are normalized before the call.
        CHECK(resolver.calls[0] == uR"(dir\file)");
    }

    TEST_CASE("Non-ASCII text survives the round trip") {
        FakeResolver resolver;
        auto         result = win_absolute("caf\xC3\xA9", resolver);
        REQUIRE(result.has_value());
        CHECK(*result == "C:\\work\\caf\xC3\xA9");
        CHECK(resolver.calls[0] == u"caf\u00E9");
    }

    TEST_CASE("Empty and verbatim paths skip the resolver") {
        FakeResolver resolver;
        auto         empty = win_absolute("", resolver);
        REQUIRE(empty.has_value());
        CHECK(empty->empty());

        auto verbatim = win_absolute(R"(\\?\C:\a/..\b)", resolver);
        REQUIRE(verbatim.has_value());
        CHECK(*verbatim == R"(\\?\C:\a/..\b)");
        CHECK(resolver.calls.empty());
    }

    TEST_CASE("Embedded nulls are rejected before resolving") {
        FakeResolver resolver;
        auto         result = win_absolute(std::string_view{"a\0b", 3}, resolver);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::EmbeddedNull);
        CHECK(resolver.calls.empty());
    }

    TEST_CASE("Malformed UTF-8 is rejected before resolving") {
        FakeResolver resolver;
        auto         result = win_absolute("a\xFF", resolver);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::MalformedInput);
        CHECK(resolver.calls.empty());
    }

    TEST_CASE("Resolver errors are passed on") {
        FakeResolver resolver;
        resolver.failure = Error{Error::Code::OsError, "access denied"};
        auto result      = win_absolute("x", resolver);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::OsError);
        CHECK(describeError(result.error()) == "os_error:access denied");
    }

    TEST_CASE("Resolving relative prefixes") {
        FakeResolver resolver;

        auto current = win_resolve_prefix(Win32Relative::currentDirectory(), resolver);
        REQUIRE(current.has_value());
        CHECK(*current == R"(C:\work\.\)");

        auto root = win_resolve_prefix(Win32Relative::root(), resolver);
        REQUIRE(root.has_value());

        auto drive = win_resolve_prefix(Win32Relative::driveRelative(u'D'), resolver);
        REQUIRE(drive.has_value());
        CHECK(*drive == "D:");

        REQUIRE(resolver.calls.size() == 3);
        CHECK(resolver.calls[0] == uR"(.\)");
        CHECK(resolver.calls[1] == uR"(\)");
        CHECK(resolver.calls[2] == u"D:");
    }
}
