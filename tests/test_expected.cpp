#include "catch2_custom.hpp"

#include "common/error_types.hpp"
#include "common/expected.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <system_error>

using assessgrader::ErrorKind;
using assessgrader::Expected;
using assessgrader::Result;

namespace {

Result<int> parse_positive(int value) {
    if (value <= 0) {
        return ErrorKind::InvalidPayload;
    }
    return value;
}

Result<int> doubled(int value) {
    int parsed = TRY(parse_positive(value));
    return parsed * 2;
}

Result<void> checked(int value) {
    TRYE(parse_positive(value), QuestionNotFound);
    return {};
}

} // namespace

TEST_CASE("Expected holds a value or an error") {
    Expected<int, std::string> ok = 42;
    Expected<int, std::string> bad = std::string{"nope"};

    REQUIRE(ok.has_value());
    REQUIRE(ok == 42);
    REQUIRE(*ok == 42);
    REQUIRE(ok.value_or(0) == 42);

    REQUIRE(bad.has_error());
    REQUIRE(bad.error() == "nope");
    REQUIRE(bad.value_or(7) == 7);
    REQUIRE_FALSE(bad == 42);
}

TEST_CASE("Expected<void> default constructs to success") {
    Expected<void, std::string> res;
    REQUIRE(res);

    Expected<void, std::string> err = std::string{"failed"};
    REQUIRE_FALSE(err);
    REQUIRE(err.error() == "failed");
}

TEST_CASE("transform and transform_error") {
    Result<int> ok = 3;
    REQUIRE(ok.transform([](int v) { return v + 1; }) == 4);

    Result<int> err = ErrorKind::TimedOut;
    auto mapped = err.transform([](int v) { return v + 1; });
    REQUIRE(mapped == ErrorKind::TimedOut);

    auto as_code = err.transform_error([](ErrorKind) { return std::make_error_code(std::errc::timed_out); });
    REQUIRE(as_code.error() == std::errc::timed_out);
}

TEST_CASE("TRY propagates errors and unwraps values") {
    REQUIRE(doubled(5) == 10);
    REQUIRE(doubled(-1) == ErrorKind::InvalidPayload);
}

TEST_CASE("TRYE replaces the propagated error") {
    REQUIRE(checked(1));
    REQUIRE(checked(0).error() == ErrorKind::QuestionNotFound);
}

TEST_CASE("Expected is formattable") {
    Result<int> ok = 1;
    Result<int> err = ErrorKind::AttemptClosed;

    REQUIRE(fmt::format("{}", ok) == "Expected(1)");
    REQUIRE(fmt::format("{}", err) == "Error(AttemptClosed)");
}
