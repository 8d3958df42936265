/**
 * @file chat_turn_example.cpp
 * @brief One chat turn through the vault with an in-memory store and an echo backend
 */

#include "chatvault/configuration/vault_config.hpp"
#include "chatvault/crypto/content_hash.hpp"
#include "chatvault/crypto/encoding.hpp"
#include "chatvault/crypto/message_codec.hpp"
#include "chatvault/crypto/sodium_interop.hpp"
#include "chatvault/keys/static_key_provider.hpp"
#include "chatvault/logging/logger.hpp"
#include "chatvault/pipeline/message_pipeline.hpp"
#include "chatvault/storage/in_memory_session_store.hpp"

#include <iostream>

using namespace chatvault;
using namespace chatvault::crypto;

class EchoBackend : public interfaces::IGenerationBackend {
public:
    Result<interfaces::GenerationResponse, VaultFailure> Generate(
        const interfaces::GenerationRequest& request) override {
        return Result<interfaces::GenerationResponse, VaultFailure>::Ok(interfaces::GenerationResponse{
            .status_code = 200,
            .answer = "You said: " + request.query,
            .sources = {"echo"}});
    }
};

int main() {
    std::cout << "=== chatvault - Chat Turn Example ===" << std::endl;

    if (SodiumInterop::Initialize().IsErr()) {
        std::cerr << "Failed to initialize libsodium" << std::endl;
        return 1;
    }
    auto config = configuration::VaultConfig::Default();
    logging::Configure(config);

    auto provider = keys::StaticKeyProvider::Placeholder();
    if (provider.IsErr()) {
        std::cerr << "Key provider: " << provider.UnwrapErr().message << std::endl;
        return 1;
    }
    auto codec = std::make_shared<MessageCodec>(std::move(provider).Unwrap());
    auto store = std::make_shared<storage::InMemorySessionStore>(storage::StoreOptions::FromConfig(config));
    pipeline::MessagePipeline vault(store, codec, std::make_shared<EchoBackend>(), config);

    // What the client does: encrypt with the shared key, hash the ciphertext
    const models::EncryptionMetadata client_metadata{
        .algorithm = models::EncryptionAlgorithm::Aes256Gcm,
        .key_id = std::string(VaultConstants::WELL_KNOWN_CLIENT_KEY_ID),
        .iv = {},
        .created_at = {}};
    auto sealed = codec->Encrypt("Hello, vault!", client_metadata);
    if (sealed.IsErr()) {
        std::cerr << "Encrypt: " << sealed.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& payload = sealed.Unwrap();
    models::ChatTurnRequest request{
        .encrypted_message = Encoding::ToBase64(payload.ciphertext),
        .encryption_metadata = payload.metadata.ToFields(),
        .content_hash = ContentHash::Compute(payload.ciphertext),
        .session_id = std::nullopt};

    auto response = vault.ProcessTurn("example-user", request);
    if (response.IsErr()) {
        std::cerr << "Turn failed: " << ToString(response.UnwrapErr().type) << ": "
                  << response.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& turn = response.Unwrap();
    std::cout << "Session:      " << turn.session_id << std::endl;
    std::cout << "Content hash: " << turn.content_hash << std::endl;

    auto ciphertext = Encoding::FromBase64(turn.encrypted_response);
    if (ciphertext.IsErr()) {
        std::cerr << "Bad response encoding" << std::endl;
        return 1;
    }
    auto reply = codec->Decrypt(ciphertext.Unwrap(), turn.encryption_metadata);
    if (reply.IsErr()) {
        std::cerr << "Decrypt: " << reply.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "Reply:        " << reply.Unwrap() << std::endl;

    auto session = store->GetSession(turn.session_id, "example-user");
    if (session.IsOk() && session.Unwrap().has_value()) {
        std::cout << "Title:        " << session.Unwrap()->title << std::endl;
    }
    return 0;
}
