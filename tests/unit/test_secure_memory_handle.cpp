#include <catch2/catch_test_macros.hpp>
#include "chatvault/crypto/secure_memory_handle.hpp"
#include "chatvault/crypto/sodium_interop.hpp"
#include "chatvault/core/constants.hpp"

#include <algorithm>
#include <vector>

using namespace chatvault;
using namespace chatvault::crypto;

namespace {

std::vector<uint8_t> Contents(const SecureMemoryHandle& handle) {
    std::vector<uint8_t> out(handle.Size());
    REQUIRE(handle.Read(out).IsOk());
    return out;
}

}

TEST_CASE("SecureMemoryHandle - Key regions", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Fresh region is zero-filled") {
        auto handle = SecureMemoryHandle::Allocate(Constants::AES_KEY_SIZE).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == Constants::AES_KEY_SIZE);
        REQUIRE(Contents(handle) == std::vector<uint8_t>(Constants::AES_KEY_SIZE, 0));
    }
    SECTION("Empty region is refused") {
        auto zero = SecureMemoryHandle::Allocate(0);
        REQUIRE(zero.IsErr());
        REQUIRE(zero.UnwrapErr().type == SodiumFailureType::AllocationFailed);
        REQUIRE(SecureMemoryHandle::FromBytes({}).IsErr());
    }
    SECTION("Key bytes are held verbatim") {
        const std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0x5A);
        auto handle = SecureMemoryHandle::FromBytes(key).Unwrap();
        REQUIRE(Contents(handle) == key);
    }
    SECTION("Short write zeroes the rest of the region") {
        auto handle = SecureMemoryHandle::FromBytes(std::vector<uint8_t>(8, 0xEE)).Unwrap();
        const std::vector<uint8_t> prefix = {1, 2, 3};
        REQUIRE(handle.Write(prefix).IsOk());
        REQUIRE(Contents(handle) == std::vector<uint8_t>{1, 2, 3, 0, 0, 0, 0, 0});
    }
    SECTION("Oversized write and undersized read are refused") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        REQUIRE(handle.Write(std::vector<uint8_t>(17, 0x01)).UnwrapErr().type == SodiumFailureType::BufferTooSmall);
        std::vector<uint8_t> small(15);
        REQUIRE(handle.Read(small).UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
}

TEST_CASE("SecureMemoryHandle - Ownership", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto original = SecureMemoryHandle::FromBytes(std::vector<uint8_t>(32, 0x42)).Unwrap();

    SECTION("Moving leaves the source released") {
        SecureMemoryHandle moved(std::move(original));
        REQUIRE(original.IsInvalid());
        REQUIRE(original.Size() == 0);
        REQUIRE(moved.Size() == 32);

        std::vector<uint8_t> buffer(32);
        REQUIRE(original.Read(buffer).UnwrapErr().type == SodiumFailureType::InvalidOperation);
        REQUIRE(original.Write(buffer).IsErr());
    }
    SECTION("Move assignment replaces the previous region") {
        auto target = SecureMemoryHandle::Allocate(64).Unwrap();
        target = std::move(original);
        REQUIRE(target.Size() == 32);
        REQUIRE(Contents(target) == std::vector<uint8_t>(32, 0x42));
    }
    SECTION("Lent view sees the key and nothing else") {
        auto all_set = original.WithReadAccess([](std::span<const uint8_t> key) {
            return key.size() == 32 && std::all_of(key.begin(), key.end(), [](uint8_t b) { return b == 0x42; });
        });
        REQUIRE(all_set.IsOk());
        REQUIRE(all_set.Unwrap());
    }
    SECTION("Released handle never runs the borrower") {
        SecureMemoryHandle released;
        bool called = false;
        auto result = released.WithReadAccess([&called](std::span<const uint8_t>) {
            called = true;
            return 0;
        });
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(called);
    }
}
