#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

#include <string>

using namespace uuidsort;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries the structured error", "[result]") {
    auto result = Result<int>::err(Error::invalid_version(4));

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidVersion);
    REQUIRE(result.unwrap_err().observed_version == 4);
    REQUIRE(result.unwrap_err().message == "input UUID was version 4");
}

TEST_CASE("Result::unwrap throws on misuse", "[result]") {
    auto err_result = Result<int>::err(Error::out_of_range(uint64_t{1} << 60));
    auto ok_result = Result<int>::ok(1);

    REQUIRE_THROWS_AS(err_result.unwrap(), std::logic_error);
    REQUIRE_THROWS_AS(ok_result.unwrap_err(), std::logic_error);
}

TEST_CASE("Result::value_or returns fallback on error", "[result]") {
    REQUIRE(Result<int>::ok(42).value_or(0) == 42);
    REQUIRE(Result<int>::err(Error::invalid_version(0)).value_or(7) == 7);
}

TEST_CASE("Result::map and and_then propagate the first error", "[result]") {
    auto half = [](int x) -> Result<int> {
        if (x % 2 != 0) return Result<int>::err(Error::out_of_range(static_cast<uint64_t>(x)));
        return Result<int>::ok(x / 2);
    };

    auto chained = Result<int>::ok(12).and_then(half).map([](int x) { return x + 1; });
    REQUIRE(chained.unwrap() == 7);

    auto failed = Result<int>::ok(3).and_then(half).map([](int x) { return x + 1; });
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().kind == ErrorKind::OutOfRange);
    REQUIRE(failed.unwrap_err().offending_ticks == uint64_t{3});
}

TEST_CASE("Result::map_err converts the error type", "[result]") {
    auto mapped = Result<int>::err(Error::invalid_version(2)).map_err([](const Error& e) {
        return e.message;
    });

    REQUIRE(mapped.is_err());
    REQUIRE(mapped.unwrap_err() == "input UUID was version 2");
}

TEST_CASE("Result works when value and error types coincide", "[result]") {
    auto ok_result = Result<std::string, std::string>::ok("value");
    auto err_result = Result<std::string, std::string>::err("error");

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());
    REQUIRE(ok_result.unwrap() == "value");
    REQUIRE(err_result.unwrap_err() == "error");
}

TEST_CASE("Result::match handles both cases", "[result]") {
    auto describe = [](const Result<int>& r) {
        return r.match(
            [](int x) { return x; },
            [](const Error&) { return -1; });
    };

    REQUIRE(describe(Result<int>::ok(42)) == 42);
    REQUIRE(describe(Result<int>::err(Error::invalid_version(3))) == -1);
}
