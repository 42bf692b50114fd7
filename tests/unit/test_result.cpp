#include <catch2/catch_test_macros.hpp>
#include "omemo_send/core/result.hpp"
#include "omemo_send/core/failures.hpp"

#include <stdexcept>
#include <string>

using namespace omemo_send;

TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, WorkflowFailure>::Err(WorkflowFailure::DispatchFailed("offline"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == WorkflowFailureType::DispatchFailed);
        REQUIRE(result.UnwrapErr().message == "offline");
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::logic_error);
    }
    SECTION("UnwrapErr on Ok throws") {
        auto result = Result<int, std::string>::Ok(1);
        REQUIRE_THROWS_AS(result.UnwrapErr(), std::logic_error);
    }
}

TEST_CASE("Result<T, E> - Map", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto mapped = Result<int, std::string>::Ok(21).Map([](int x) { return x * 2; });
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto mapped = Result<int, std::string>::Err("error").Map([](int x) { return x * 2; });
        REQUIRE(mapped.UnwrapErr() == "error");
    }
}

TEST_CASE("Result<T, E> - Try factory", "[result][core]") {
    SECTION("Try captures successful execution") {
        auto result = Result<int, std::string>::Try(
            []() { return 42; },
            [](const std::exception& ex) { return std::string(ex.what()); });
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Try captures exceptions") {
        auto result = Result<int, std::string>::Try(
            []() -> int { throw std::runtime_error("oops"); },
            [](const std::exception& ex) { return std::string(ex.what()); });
        REQUIRE(result.UnwrapErr() == "oops");
    }
}
