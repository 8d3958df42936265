#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace chatvault::crypto {

/**
 * @brief SHA-256 content address of a stored ciphertext
 *
 * Independent of the GCM tag: it can be checked before paying for a key
 * lookup and a decrypt, and it binds the exact bytes the store holds.
 */
class ContentHash {
public:
    /** 64 lowercase hex characters over the raw ciphertext bytes. */
    [[nodiscard]] static std::string Compute(std::span<const uint8_t> ciphertext);

    /**
     * @brief Recompute and compare in constant time
     *
     * @return false on mismatch and on a claimed hash that is not 64 hex characters
     */
    [[nodiscard]] static bool Verify(std::span<const uint8_t> ciphertext, std::string_view claimed_hash);

    /** Integrity failure on mismatch. */
    static Result<Unit, VaultFailure> Require(std::span<const uint8_t> ciphertext, std::string_view claimed_hash);

private:
    ContentHash() = delete;
};

} // namespace chatvault::crypto
