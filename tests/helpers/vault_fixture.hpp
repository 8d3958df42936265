#pragma once
#include "helpers/fake_generation_backend.hpp"
#include "chatvault/configuration/vault_config.hpp"
#include "chatvault/crypto/content_hash.hpp"
#include "chatvault/crypto/encoding.hpp"
#include "chatvault/crypto/message_codec.hpp"
#include "chatvault/crypto/sodium_interop.hpp"
#include "chatvault/core/constants.hpp"
#include "chatvault/keys/static_key_provider.hpp"
#include "chatvault/pipeline/message_pipeline.hpp"
#include "chatvault/storage/in_memory_session_store.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace chatvault::test_helpers {

inline models::EncryptionMetadata ClientMetadata(
    std::string key_id = std::string(VaultConstants::WELL_KNOWN_CLIENT_KEY_ID)) {
    return models::EncryptionMetadata{
        .algorithm = models::EncryptionAlgorithm::Aes256Gcm,
        .key_id = std::move(key_id),
        .iv = {},
        .created_at = {}};
}

// Encrypts and hashes @p plaintext the way a client would.
inline models::ChatTurnRequest BuildTurn(
    const crypto::MessageCodec& codec,
    const std::string& plaintext,
    std::optional<std::string> session_id = std::nullopt) {
    auto sealed = codec.Encrypt(plaintext, ClientMetadata());
    if (sealed.IsErr()) {
        throw std::runtime_error(sealed.UnwrapErr().message);
    }
    const auto& payload = sealed.Unwrap();
    return models::ChatTurnRequest{
        .encrypted_message = crypto::Encoding::ToBase64(payload.ciphertext),
        .encryption_metadata = payload.metadata.ToFields(),
        .content_hash = crypto::ContentHash::Compute(payload.ciphertext),
        .session_id = std::move(session_id)};
}

// Placeholder keys, in-memory store, scriptable backend.
struct VaultFixture {
    explicit VaultFixture(configuration::VaultConfig config = configuration::VaultConfig::Default())
        : VaultFixture(std::make_shared<storage::InMemorySessionStore>(
                           storage::StoreOptions::FromConfig(config)),
                       config) {}

    VaultFixture(std::shared_ptr<interfaces::ISessionRepository> repository,
                 configuration::VaultConfig config) {
        if (crypto::SodiumInterop::Initialize().IsErr()) {
            throw std::runtime_error("libsodium initialization failed");
        }
        auto provider = keys::StaticKeyProvider::Placeholder();
        if (provider.IsErr()) {
            throw std::runtime_error(provider.UnwrapErr().message);
        }
        codec = std::make_shared<crypto::MessageCodec>(std::move(provider).Unwrap());
        store = std::move(repository);
        backend = std::make_shared<FakeGenerationBackend>();
        pipeline = std::make_unique<pipeline::MessagePipeline>(store, codec, backend, std::move(config));
    }

    [[nodiscard]] models::ChatTurnRequest Turn(
        const std::string& plaintext, std::optional<std::string> session_id = std::nullopt) const {
        return BuildTurn(*codec, plaintext, std::move(session_id));
    }

    [[nodiscard]] std::string Open(const models::ChatTurnResponse& response) const {
        auto ciphertext = crypto::Encoding::FromBase64(response.encrypted_response);
        if (ciphertext.IsErr()) {
            throw std::runtime_error(ciphertext.UnwrapErr().message);
        }
        auto plaintext = codec->Decrypt(ciphertext.Unwrap(), response.encryption_metadata);
        if (plaintext.IsErr()) {
            throw std::runtime_error(plaintext.UnwrapErr().message);
        }
        return plaintext.Unwrap();
    }

    [[nodiscard]] std::string Open(const models::MessageRecord& message) const {
        auto plaintext = codec->Decrypt(message.ciphertext, message.metadata);
        if (plaintext.IsErr()) {
            throw std::runtime_error(plaintext.UnwrapErr().message);
        }
        return plaintext.Unwrap();
    }

    std::shared_ptr<crypto::MessageCodec> codec;
    std::shared_ptr<interfaces::ISessionRepository> store;
    std::shared_ptr<FakeGenerationBackend> backend;
    std::unique_ptr<pipeline::MessagePipeline> pipeline;
};

}
