#include <catch2/catch_test_macros.hpp>
#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"

#include <string>

using namespace chatvault;

TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Same value and error type keeps the alternatives apart") {
        auto ok = Result<std::string, std::string>::Ok("value");
        auto err = Result<std::string, std::string>::Err("failure");
        REQUIRE(ok.IsOk());
        REQUIRE(err.IsErr());
        REQUIRE(err.UnwrapErr() == "failure");
    }
    SECTION("Unwrapping the wrong side throws") {
        auto ok = Result<int, std::string>::Ok(1);
        auto err = Result<int, std::string>::Err("e");
        REQUIRE_THROWS_AS(ok.UnwrapErr(), std::runtime_error);
        REQUIRE_THROWS_AS(err.Unwrap(), std::runtime_error);
    }
}

TEST_CASE("Result<T, E> - Combinators", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto mapped = Result<int, std::string>::Ok(21).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto mapped = Result<int, std::string>::Err("error").Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("MapErr converts the failure type") {
        auto mapped = Result<int, std::string>::Err("disk full").MapErr([](std::string s) {
            return VaultFailure::Storage(std::move(s));
        });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr().Is(VaultFailureType::Storage));
        REQUIRE(mapped.UnwrapErr().message == "disk full");
    }
    SECTION("Bind short-circuits on the first failure") {
        int calls = 0;
        auto bound = Result<int, std::string>::Err("early").Bind([&calls](int x) {
            ++calls;
            return Result<int, std::string>::Ok(x);
        });
        REQUIRE(bound.IsErr());
        REQUIRE(calls == 0);
    }
    SECTION("Bind chains operations") {
        auto bound = Result<int, std::string>::Ok(10).Bind([](int x) {
            if (x > 5) {
                return Result<int, std::string>::Ok(x * 2);
            }
            return Result<int, std::string>::Err("too small");
        });
        REQUIRE(bound.Unwrap() == 20);
    }
}

TEST_CASE("VaultFailure - Kinds", "[result][core]") {
    SECTION("Access denied never names the session") {
        const auto failure = VaultFailure::AccessDenied();
        REQUIRE(failure.Is(VaultFailureType::AccessDenied));
        REQUIRE(failure.message == "Session not found or access denied");
    }
    SECTION("Every kind has a printable name") {
        REQUIRE(ToString(VaultFailureType::Integrity) == "IntegrityError");
        REQUIRE(ToString(VaultFailureType::Decryption) == "DecryptionError");
        REQUIRE(ToString(VaultFailureType::Cancelled) == "Cancelled");
    }
    SECTION("Sodium failures surface as generic vault failures") {
        const auto failure = VaultFailure::FromSodiumFailure(
            SodiumFailure::AllocationFailed("no memory"));
        REQUIRE(failure.Is(VaultFailureType::Generic));
        REQUIRE(failure.message == "no memory");
    }
}
