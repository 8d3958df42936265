#include "chatvault/models/encryption_metadata.hpp"
#include "chatvault/core/constants.hpp"
#include "chatvault/core/format.hpp"

namespace chatvault::models {

std::string_view AlgorithmTag(const EncryptionAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case EncryptionAlgorithm::Aes256Gcm:
            return VaultConstants::ALGORITHM_AES_256_GCM;
    }
    return "unknown";
}

Result<EncryptionAlgorithm, VaultFailure> ParseAlgorithm(std::string_view tag) {
    if (tag == VaultConstants::ALGORITHM_AES_256_GCM) {
        return Result<EncryptionAlgorithm, VaultFailure>::Ok(EncryptionAlgorithm::Aes256Gcm);
    }
    return Result<EncryptionAlgorithm, VaultFailure>::Err(
        VaultFailure::Validation(compat::format("Unsupported encryption algorithm '{}'", tag)));
}

Result<EncryptionMetadata, VaultFailure> EncryptionMetadata::Parse(
    std::string_view algorithm_tag,
    std::string_view key_id,
    std::string_view iv,
    std::string_view created_at) {
    auto algorithm = ParseAlgorithm(algorithm_tag);
    if (algorithm.IsErr()) {
        return Result<EncryptionMetadata, VaultFailure>::Err(algorithm.UnwrapErr());
    }
    if (key_id.empty()) {
        return Result<EncryptionMetadata, VaultFailure>::Err(
            VaultFailure::Validation("Encryption metadata has an empty key_id"));
    }
    return Result<EncryptionMetadata, VaultFailure>::Ok(EncryptionMetadata{
        .algorithm = algorithm.Unwrap(),
        .key_id = std::string(key_id),
        .iv = std::string(iv),
        .created_at = std::string(created_at)});
}

Result<EncryptionMetadata, VaultFailure> EncryptionMetadata::Parse(const MetadataFields& fields) {
    return Parse(fields.algorithm, fields.key_id, fields.iv, fields.created_at);
}

MetadataFields EncryptionMetadata::ToFields() const {
    return MetadataFields{
        .algorithm = std::string(AlgorithmTag(algorithm)),
        .key_id = key_id,
        .iv = iv,
        .created_at = created_at};
}

} // namespace chatvault::models
