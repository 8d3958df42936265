#include "chatvault/crypto/sodium_interop.hpp"

#include <sodium.h>

namespace chatvault::crypto {

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, [] {
        // 1 means "already initialized", which is fine
        initialized_.store(sodium_init() >= SodiumConstants::SUCCESS, std::memory_order_release);
    });
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::RequireInitialized() {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (auto ready = RequireInitialized(); ready.IsErr()) {
        return ready;
    }
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::string& text) {
    auto wiped = SecureWipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(text.data()), text.size()));
    text.clear();
    return wiped;
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {
    if (auto ready = RequireInitialized(); ready.IsErr()) {
        return Result<bool, SodiumFailure>::Err(ready.UnwrapErr());
    }
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    return Result<bool, SodiumFailure>::Ok(sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS);
}

std::array<uint8_t, Constants::SHA_256_DIGEST_SIZE> SodiumInterop::Sha256(std::span<const uint8_t> data) {
    static_assert(crypto_hash_sha256_BYTES == Constants::SHA_256_DIGEST_SIZE);
    std::array<uint8_t, Constants::SHA_256_DIGEST_SIZE> digest{};
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

} // namespace chatvault::crypto
