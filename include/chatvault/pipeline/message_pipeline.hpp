#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"
#include "chatvault/configuration/vault_config.hpp"
#include "chatvault/crypto/message_codec.hpp"
#include "chatvault/interfaces/i_generation_backend.hpp"
#include "chatvault/interfaces/i_session_repository.hpp"
#include "chatvault/models/chat_turn.hpp"
#include "chatvault/models/message_record.hpp"

#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace chatvault::pipeline {

/**
 * @brief Runs one chat turn end to end
 *
 * The only component that holds plaintext, and only for the duration of a
 * call. Per turn:
 *
 *   Received -> Stored(user) -> ContextBuilt -> GenerationAttempted -> Stored(bot) -> Returned
 *
 * Everything before Stored(user) is validation: a request that fails base64,
 * metadata, id, hash or decryption checks leaves the store untouched. Once
 * the user turn is stored it stays stored whatever happens next. Generation
 * failures never fail the turn; they produce the configured fallback reply,
 * encrypted and hashed like any other.
 *
 * Holds no locks of its own; concurrent turns are serialized only by the store.
 */
class MessagePipeline {
public:
    MessagePipeline(
        std::shared_ptr<interfaces::ISessionRepository> repository,
        std::shared_ptr<crypto::MessageCodec> codec,
        std::shared_ptr<interfaces::IGenerationBackend> backend,
        configuration::VaultConfig config);

    /**
     * @brief Store the user turn, generate and store the reply
     *
     * @param owner_id Authenticated caller, trusted as given
     * @param stop Cancellation observed after the user turn is stored yields Cancelled
     */
    [[nodiscard]] Result<models::ChatTurnResponse, VaultFailure> ProcessTurn(
        std::string_view owner_id,
        const models::ChatTurnRequest& request,
        std::stop_token stop = {});

    /** Stored messages of one session, still encrypted, oldest first. */
    [[nodiscard]] Result<std::vector<models::MessageRecord>, VaultFailure> GetHistory(
        std::string_view owner_id,
        std::string_view session_id);

    [[nodiscard]] const configuration::VaultConfig& Config() const noexcept { return config_; }

private:
    struct InboundTurn {
        std::vector<uint8_t> ciphertext;
        models::EncryptionMetadata metadata;
        std::string content_hash;
        std::optional<std::string> session_id;
        std::string plaintext;
    };

    struct Reply {
        std::string text;
        std::vector<std::string> sources;
        bool fallback = false;
    };

    Result<InboundTurn, VaultFailure> Receive(const models::ChatTurnRequest& request) const;

    Result<std::vector<interfaces::GenerationTurn>, VaultFailure> BuildContext(
        std::string_view session_id,
        std::string_view owner_id,
        std::string_view current_message_id) const;

    Reply Generate(const std::string& query, std::vector<interfaces::GenerationTurn> history) const;

    std::shared_ptr<interfaces::ISessionRepository> repository_;
    std::shared_ptr<crypto::MessageCodec> codec_;
    std::shared_ptr<interfaces::IGenerationBackend> backend_;
    configuration::VaultConfig config_;
};

} // namespace chatvault::pipeline
