#pragma once
#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace chatvault::crypto {

/**
 * AES-256-GCM without associated data, as used for stored chat turns.
 *
 * Output layout is ciphertext || 16-byte tag, which is also the layout the
 * client applications produce, so stored bytes can be handed back unchanged.
 *
 * This class is a stateless primitive and does not track nonces. Callers
 * must never repeat a (key, nonce) pair; MessageCodec draws a fresh random
 * 96-bit nonce for every call.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext);
    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag);
private:
    AesGcm() = delete;
};
}
