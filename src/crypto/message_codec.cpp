#include "chatvault/crypto/message_codec.hpp"
#include "chatvault/crypto/aes_gcm.hpp"
#include "chatvault/crypto/encoding.hpp"
#include "chatvault/crypto/sodium_interop.hpp"
#include "chatvault/core/constants.hpp"
#include "chatvault/core/format.hpp"
#include "chatvault/models/timestamp.hpp"

namespace chatvault::crypto {

namespace {

Result<Unit, VaultFailure> RequireKeySize(std::span<const uint8_t> key) {
    if (key.size() != Constants::AES_KEY_SIZE) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::DeriveKey(
            compat::format("Key provider returned {} bytes, expected {}", key.size(), Constants::AES_KEY_SIZE)));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

} // namespace

MessageCodec::MessageCodec(std::shared_ptr<interfaces::IKeyProvider> key_provider)
    : key_provider_(std::move(key_provider)) {}

Result<EncryptedPayload, VaultFailure> MessageCodec::Encrypt(
    std::span<const uint8_t> plaintext,
    const models::EncryptionMetadata& inbound_metadata) const {
    const auto nonce = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);

    auto ciphertext = key_provider_->ExecuteWithKeyTyped<std::vector<uint8_t>>(
        inbound_metadata.key_id,
        [&](std::span<const uint8_t> key) -> Result<std::vector<uint8_t>, VaultFailure> {
            if (auto size_ok = RequireKeySize(key); size_ok.IsErr()) {
                return Result<std::vector<uint8_t>, VaultFailure>::Err(size_ok.UnwrapErr());
            }
            return AesGcm::Encrypt(key, nonce, plaintext);
        });
    if (ciphertext.IsErr()) {
        return Result<EncryptedPayload, VaultFailure>::Err(ciphertext.UnwrapErr());
    }

    return Result<EncryptedPayload, VaultFailure>::Ok(EncryptedPayload{
        .ciphertext = std::move(ciphertext).Unwrap(),
        .metadata = models::EncryptionMetadata{
            .algorithm = inbound_metadata.algorithm,
            .key_id = inbound_metadata.key_id,
            .iv = Encoding::ToBase64(nonce),
            .created_at = models::FormatIso8601(models::Now())}});
}

Result<EncryptedPayload, VaultFailure> MessageCodec::Encrypt(
    std::string_view plaintext,
    const models::EncryptionMetadata& inbound_metadata) const {
    return Encrypt(Encoding::AsBytes(plaintext), inbound_metadata);
}

Result<std::vector<uint8_t>, VaultFailure> MessageCodec::DecodeNonce(std::string_view iv) const {
    if (iv.empty()) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::Decryption(std::string(ErrorMessages::MISSING_NONCE)));
    }
    auto nonce = Encoding::FromBase64(iv).MapErr([](const VaultFailure&) {
        return VaultFailure::Decryption("Encryption metadata nonce is not valid base64");
    });
    if (nonce.IsErr()) {
        return nonce;
    }
    if (nonce.Unwrap().size() != Constants::AES_GCM_NONCE_SIZE) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(VaultFailure::Decryption(
            compat::format("Nonce must be {} bytes, got {}",
                           Constants::AES_GCM_NONCE_SIZE, nonce.Unwrap().size())));
    }
    return nonce;
}

Result<std::string, VaultFailure> MessageCodec::Decrypt(
    std::span<const uint8_t> ciphertext,
    const models::EncryptionMetadata& metadata) const {
    return DecodeNonce(metadata.iv)
        .Bind([&](std::vector<uint8_t> nonce) {
            return key_provider_->ExecuteWithKeyTyped<std::vector<uint8_t>>(
                metadata.key_id,
                [&](std::span<const uint8_t> key) -> Result<std::vector<uint8_t>, VaultFailure> {
                    if (auto size_ok = RequireKeySize(key); size_ok.IsErr()) {
                        return Result<std::vector<uint8_t>, VaultFailure>::Err(size_ok.UnwrapErr());
                    }
                    return AesGcm::Decrypt(key, nonce, ciphertext);
                });
        })
        .Map([](std::vector<uint8_t> bytes) {
            std::string text(bytes.begin(), bytes.end());
            auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(bytes));
            (void)wipe;
            return text;
        });
}

} // namespace chatvault::crypto
