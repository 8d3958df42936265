#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"
#include "chatvault/core/constants.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace chatvault::crypto {

/**
 * @brief The libsodium primitives the vault relies on
 *
 * Library start-up, CSPRNG, wiping, constant-time comparison and SHA-256.
 * AEAD and key derivation go through OpenSSL (AesGcm, Hkdf).
 */
class SodiumInterop {
public:
    /**
     * @brief Run sodium_init once per process
     *
     * Must succeed before any other vault operation. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /// Zero @p buffer in a way the optimizer cannot elide
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /// Zero transient plaintext held in a string, then empty it
    static Result<Unit, SodiumFailure> SecureWipe(std::string& text);

    /**
     * @brief Constant-time comparison
     *
     * @return Ok(false) for buffers of different length
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    static std::array<uint8_t, Constants::SHA_256_DIGEST_SIZE> Sha256(std::span<const uint8_t> data);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

private:
    static Result<Unit, SodiumFailure> RequireInitialized();

    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
};

} // namespace chatvault::crypto
