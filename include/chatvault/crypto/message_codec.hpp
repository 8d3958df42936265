#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"
#include "chatvault/interfaces/i_key_provider.hpp"
#include "chatvault/models/encryption_metadata.hpp"
#include "chatvault/models/session_record.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace chatvault::crypto {

using EncryptedPayload = models::EncryptedBlob;

/**
 * @brief AES-256-GCM encryption of single chat messages
 *
 * Keys come from the injected IKeyProvider, selected by metadata.key_id.
 * Every Encrypt call draws a fresh 96-bit nonce from the libsodium CSPRNG;
 * the 16-byte tag is appended to the ciphertext. No associated data.
 *
 * @code
 * MessageCodec codec(provider);
 * auto sealed = codec.Encrypt("hello", inbound_metadata);
 * auto opened = codec.Decrypt(sealed.Unwrap().ciphertext, sealed.Unwrap().metadata);
 * @endcode
 */
class MessageCodec {
public:
    explicit MessageCodec(std::shared_ptr<interfaces::IKeyProvider> key_provider);

    /**
     * @brief Encrypt under the key named by @p inbound_metadata
     *
     * The returned metadata keeps the algorithm and key_id of @p inbound_metadata,
     * carries the new nonce (base64) and the current UTC time as created_at.
     */
    [[nodiscard]] Result<EncryptedPayload, VaultFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        const models::EncryptionMetadata& inbound_metadata) const;

    [[nodiscard]] Result<EncryptedPayload, VaultFailure> Encrypt(
        std::string_view plaintext,
        const models::EncryptionMetadata& inbound_metadata) const;

    /**
     * @brief Decrypt with the ciphertext's own metadata
     *
     * Decryption failure when the nonce is missing, not base64, not 12 bytes,
     * or when the tag does not verify (tampering or wrong key).
     */
    [[nodiscard]] Result<std::string, VaultFailure> Decrypt(
        std::span<const uint8_t> ciphertext,
        const models::EncryptionMetadata& metadata) const;

private:
    Result<std::vector<uint8_t>, VaultFailure> DecodeNonce(std::string_view iv) const;

    std::shared_ptr<interfaces::IKeyProvider> key_provider_;
};

} // namespace chatvault::crypto
