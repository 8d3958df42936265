#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace chatvault::models {

/**
 * @brief Closed set of supported AEAD schemes
 *
 * The wire tag doubles as the metadata version: a new scheme gets a new
 * member and a new tag, never a reinterpretation of an old one.
 */
enum class EncryptionAlgorithm : uint8_t {
    Aes256Gcm
};

[[nodiscard]] std::string_view AlgorithmTag(EncryptionAlgorithm algorithm) noexcept;

[[nodiscard]] Result<EncryptionAlgorithm, VaultFailure> ParseAlgorithm(std::string_view tag);

/** Unvalidated metadata as it arrives on the wire. */
struct MetadataFields {
    std::string algorithm;
    std::string key_id;
    std::string iv;
    std::string created_at;
};

/**
 * @brief Everything needed to decrypt one ciphertext, minus the key itself
 *
 * iv is the base64 transport encoding of the 12-byte nonce. created_at is
 * provenance only and never interpreted.
 */
struct EncryptionMetadata {
    EncryptionAlgorithm algorithm = EncryptionAlgorithm::Aes256Gcm;
    std::string key_id;
    std::string iv;
    std::string created_at;

    /**
     * @brief Build from wire strings
     *
     * Fails with Validation for an unsupported algorithm tag or an empty
     * key_id. The nonce is checked later, by the codec, as a decryption error.
     */
    [[nodiscard]] static Result<EncryptionMetadata, VaultFailure> Parse(
        std::string_view algorithm_tag,
        std::string_view key_id,
        std::string_view iv,
        std::string_view created_at);

    [[nodiscard]] static Result<EncryptionMetadata, VaultFailure> Parse(const MetadataFields& fields);

    [[nodiscard]] MetadataFields ToFields() const;

    bool operator==(const EncryptionMetadata&) const = default;
};

} // namespace chatvault::models
