// tether_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <tether/core/error.hpp>

#include <stdexcept>
#include <string>

using namespace tether_core;

namespace {

Result<int> parse_positive(int value) {
    if (value <= 0) {
        return Err<int>(PhysicsError::malformed_data("not positive"));
    }
    return value;
}

Result<void> require_all_positive(int a, int b) {
    TETHER_TRY(parse_positive(a));
    TETHER_TRY(parse_positive(b));
    return Ok();
}

} // namespace

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error from kind structs", "[core][error]") {
    SECTION("physics errors map to error codes") {
        Error not_found = PhysicsError::not_found("Body", "1234");
        REQUIRE(not_found.code() == ErrorCode::NotFound);
        REQUIRE(not_found.is<PhysicsError>());
        REQUIRE(not_found.as<PhysicsError>()->handle == "1234");

        Error invalid = PhysicsError::invalid_state("busy");
        REQUIRE(invalid.code() == ErrorCode::InvalidState);
        REQUIRE(invalid.message() == "Invalid state: busy");
    }

    SECTION("visit errors map to error codes") {
        Error missing = VisitError::field_not_found("Desc/Gravity");
        REQUIRE(missing.code() == ErrorCode::MissingData);
        REQUIRE(missing.as<VisitError>()->path == "Desc/Gravity");

        Error version = VisitError::unsupported_version(3, 1);
        REQUIRE(version.code() == ErrorCode::IncompatibleVersion);
        REQUIRE(version.as<VisitError>()->kind == VisitError::Kind::UnsupportedVersion);
    }

    SECTION("plain messages") {
        Error error("something broke");
        REQUIRE(error.code() == ErrorCode::Unknown);
        REQUIRE(error.message() == "something broke");
        REQUIRE(error.as<PhysicsError>() == nullptr);
    }
}

TEST_CASE("Error context chain", "[core][error]") {
    Error error = VisitError::io("disk full");
    error.with_context("file", "world.bin");

    REQUIRE(error.get_context("file") != nullptr);
    REQUIRE(*error.get_context("file") == "world.bin");
    REQUIRE(error.get_context("line") == nullptr);

    std::string chain = build_error_chain(error);
    REQUIRE(chain.find("IOError") != std::string::npos);
    REQUIRE(chain.find("disk full") != std::string::npos);
    REQUIRE(chain.find("world.bin") != std::string::npos);
}

// =============================================================================
// Result Tests
// =============================================================================

TEST_CASE("Result value access", "[core][error]") {
    Result<int> ok = parse_positive(5);
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value() == 5);
    REQUIRE(*ok == 5);
    REQUIRE(ok.value_or(0) == 5);

    Result<int> err = parse_positive(-1);
    REQUIRE(err.is_err());
    REQUIRE(err.value_or(7) == 7);
    REQUIRE(err.error().code() == ErrorCode::MalformedData);
    REQUIRE_THROWS_AS(err.unwrap(), std::runtime_error);
}

TEST_CASE("Result combinators", "[core][error]") {
    auto doubled = parse_positive(4).map([](int v) { return v * 2; });
    REQUIRE(doubled.value() == 8);

    auto chained = parse_positive(4).and_then([](int v) { return parse_positive(v - 10); });
    REQUIRE(chained.is_err());

    auto recovered = parse_positive(0).or_else([](const Error&) { return Result<int>(1); });
    REQUIRE(recovered.value() == 1);
}

TEST_CASE("TETHER_TRY propagates the first error", "[core][error]") {
    REQUIRE(require_all_positive(1, 2).is_ok());

    Result<void> failed = require_all_positive(1, -2);
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().message() == "not positive");
    REQUIRE_THROWS(failed.unwrap());
}
