#include <lexpath/core/Error.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace LP;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::NotSupported);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            // No message means the label alone.
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::EmbeddedNull, "bad"};
        CHECK(describeError(withMsg) == "embedded_null:bad");

        Error notAbsolute{Error::Code::NotAbsolute, {}};
        CHECK(describeError(notAbsolute) == "not_absolute");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Expected carries either value or error") {
        Expected<int> ok = 4;
        REQUIRE(ok.has_value());
        CHECK(*ok == 4);

        Expected<int> failed = std::unexpected(Error{Error::Code::OsError, "boom"});
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code == Error::Code::OsError);
        REQUIRE(failed.error().message.has_value());
        CHECK(*failed.error().message == "boom");
    }
}
