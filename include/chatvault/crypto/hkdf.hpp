#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace chatvault::crypto {

/**
 * @brief RFC 5869 HKDF-SHA256 (extract and expand in one call)
 *
 * Used by DerivedKeyProvider to turn one master secret into an independent
 * 32-byte message key per key_id.
 */
class Hkdf {
public:
    /**
     * @param ikm Input key material, must not be empty
     * @param output Filled with output.size() derived bytes
     * @param salt Optional salt
     * @param info Optional context binding (key_id for message keys)
     */
    static Result<Unit, VaultFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, VaultFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace chatvault::crypto
