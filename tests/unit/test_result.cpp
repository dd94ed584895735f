#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace mindsync;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries message, code and kind", "[result]") {
    auto result = Result<int>::err(Error{ErrorKind::Network, "backend unreachable", 7});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "backend unreachable");
    REQUIRE(result.unwrap_err().code == 7);
    REQUIRE(result.unwrap_err().is(ErrorKind::Network));
    REQUIRE_FALSE(result.unwrap_err().is(ErrorKind::Conflict));
}

TEST_CASE("Error without a kind is generic", "[result]") {
    Error error{"something went wrong", 1};
    REQUIRE(error.kind == ErrorKind::Generic);
    REQUIRE(error_kind_name(ErrorKind::LockHeld) == "lock_held");
    REQUIRE(error_kind_name(ErrorKind::Corruption) == "corruption");
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success value", "[result]") {
    auto mapped = Result<int>::ok(21).map([](int x) { return x * 2; });

    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.unwrap() == 42);
}

TEST_CASE("Result::map propagates error", "[result]") {
    auto mapped = Result<int>::err(Error{"error"}).map([](int x) { return x * 2; });

    REQUIRE(mapped.is_err());
    REQUIRE(mapped.unwrap_err().message == "error");
}

TEST_CASE("Result::and_then chains operations", "[result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error{ErrorKind::InvalidArgument, "division by zero"});
        return Result<int>::ok(100 / x);
    };

    REQUIRE(Result<int>::ok(5).and_then(divide).unwrap() == 20);

    auto failed = Result<int>::ok(0).and_then(divide);
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().is(ErrorKind::InvalidArgument));
}

TEST_CASE("Result::and_then short-circuits on error", "[result]") {
    bool called = false;
    auto result = Result<int>::err(Error{"initial error"}).and_then([&](int x) -> Result<int> {
        called = true;
        return Result<int>::ok(x);
    });

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "initial error");
    REQUIRE_FALSE(called);
}

TEST_CASE("Result::inspect_err only runs on error", "[result]") {
    int seen = 0;
    Result<int>::ok(1).inspect_err([&](const Error&) { ++seen; });
    Result<int>::err(Error{"boom"}).inspect_err([&](const Error&) { ++seen; });
    Result<void>::err(Error{"boom"}).inspect_err([&](const Error&) { ++seen; });
    REQUIRE(seen == 2);
}

TEST_CASE("propagate forwards the error into another value type", "[result]") {
    auto source = Result<std::string>::err(Error{ErrorKind::Corruption, "bad payload", 3});
    auto forwarded = propagate<int>(source);

    REQUIRE(forwarded.is_err());
    REQUIRE(forwarded.unwrap_err() == source.unwrap_err());
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
}

TEST_CASE("Result chaining works with different types", "[result]") {
    auto result = Result<int>::ok(5)
        .map([](int x) { return std::to_string(x); })
        .map([](const std::string& s) { return s + " maps"; });

    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap() == "5 maps");
}
