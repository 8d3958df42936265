#include "chatvault/pipeline/message_pipeline.hpp"
#include "chatvault/pipeline/title_derivation.hpp"
#include "chatvault/crypto/content_hash.hpp"
#include "chatvault/crypto/encoding.hpp"
#include "chatvault/crypto/sodium_interop.hpp"
#include "chatvault/models/identifiers.hpp"
#include "chatvault/core/constants.hpp"
#include "chatvault/core/format.hpp"
#include "chatvault/logging/logger.hpp"

#include <chrono>

namespace chatvault::pipeline {

using crypto::ContentHash;
using crypto::Encoding;
using crypto::SodiumInterop;
using interfaces::GenerationRequest;
using interfaces::GenerationTurn;
using models::ChatTurnRequest;
using models::ChatTurnResponse;
using models::MessageRecord;
using models::MessageRole;

namespace {

void WipeText(std::string& text) {
    auto wipe = SodiumInterop::SecureWipe(text);
    (void)wipe;
}

void WipeTranscript(std::vector<GenerationTurn>& transcript) {
    for (auto& turn : transcript) {
        WipeText(turn.content);
    }
    transcript.clear();
}

bool IsSuccessStatus(const int status_code) noexcept {
    return status_code >= VaultConstants::HTTP_STATUS_OK_MIN &&
           status_code <= VaultConstants::HTTP_STATUS_OK_MAX;
}

Result<ChatTurnResponse, VaultFailure> CancelledTurn(std::string_view session_id) {
    logging::GetLogger()->debug("Turn on session {} cancelled after user turn was stored", session_id);
    return Result<ChatTurnResponse, VaultFailure>::Err(
        VaultFailure::Cancelled("Chat turn cancelled; user turn remains stored"));
}

} // namespace

MessagePipeline::MessagePipeline(
    std::shared_ptr<interfaces::ISessionRepository> repository,
    std::shared_ptr<crypto::MessageCodec> codec,
    std::shared_ptr<interfaces::IGenerationBackend> backend,
    configuration::VaultConfig config)
    : repository_(std::move(repository))
    , codec_(std::move(codec))
    , backend_(std::move(backend))
    , config_(std::move(config)) {}

Result<MessagePipeline::InboundTurn, VaultFailure> MessagePipeline::Receive(
    const ChatTurnRequest& request) const {
    using R = Result<InboundTurn, VaultFailure>;

    auto ciphertext = Encoding::FromBase64(request.encrypted_message).MapErr([](const VaultFailure&) {
        return VaultFailure::Validation("encrypted_message is not valid base64");
    });
    if (ciphertext.IsErr()) {
        return R::Err(ciphertext.UnwrapErr());
    }
    auto metadata = models::EncryptionMetadata::Parse(request.encryption_metadata);
    if (metadata.IsErr()) {
        return R::Err(metadata.UnwrapErr());
    }

    std::optional<std::string> session_id;
    if (request.session_id.has_value()) {
        auto normalized = models::NormalizeUuid(*request.session_id);
        if (normalized.IsErr()) {
            return R::Err(normalized.UnwrapErr());
        }
        session_id = std::move(normalized).Unwrap();
    }

    if (auto verified = ContentHash::Require(ciphertext.Unwrap(), request.content_hash); verified.IsErr()) {
        logging::GetLogger()->error("Rejected inbound turn: content hash mismatch");
        return R::Err(verified.UnwrapErr());
    }

    auto plaintext = codec_->Decrypt(ciphertext.Unwrap(), metadata.Unwrap());
    if (plaintext.IsErr()) {
        logging::GetLogger()->error("Rejected inbound turn: {}", plaintext.UnwrapErr().message);
        return R::Err(plaintext.UnwrapErr());
    }

    std::string content_hash = request.content_hash;
    for (char& c : content_hash) {
        if (c >= 'A' && c <= 'F') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }

    return R::Ok(InboundTurn{
        .ciphertext = std::move(ciphertext).Unwrap(),
        .metadata = std::move(metadata).Unwrap(),
        .content_hash = std::move(content_hash),
        .session_id = std::move(session_id),
        .plaintext = std::move(plaintext).Unwrap()});
}

Result<std::vector<GenerationTurn>, VaultFailure> MessagePipeline::BuildContext(
    std::string_view session_id,
    std::string_view owner_id,
    std::string_view current_message_id) const {
    using R = Result<std::vector<GenerationTurn>, VaultFailure>;

    auto messages = repository_->ListMessages(session_id, owner_id);
    if (messages.IsErr()) {
        return R::Err(messages.UnwrapErr());
    }

    std::vector<GenerationTurn> transcript;
    for (const MessageRecord& message : messages.Unwrap()) {
        if (message.id == current_message_id) {
            continue;
        }
        if (config_.VerifyStoredHashes()) {
            if (auto verified = ContentHash::Require(message.ciphertext, message.content_hash); verified.IsErr()) {
                logging::GetLogger()->error("Stored message {} failed its integrity check", message.id);
                WipeTranscript(transcript);
                return R::Err(verified.UnwrapErr());
            }
        }
        auto plaintext = codec_->Decrypt(message.ciphertext, message.metadata);
        if (plaintext.IsErr()) {
            logging::GetLogger()->error("Stored message {} failed to decrypt", message.id);
            WipeTranscript(transcript);
            return R::Err(plaintext.UnwrapErr());
        }
        transcript.push_back(GenerationTurn{.role = message.role, .content = std::move(plaintext).Unwrap()});
    }
    return R::Ok(std::move(transcript));
}

MessagePipeline::Reply MessagePipeline::Generate(
    const std::string& query, std::vector<GenerationTurn> history) const {
    GenerationRequest request{
        .query = query,
        .history = std::move(history),
        .max_tokens = config_.GetMaxTokens(),
        .timeout = config_.GetGenerationTimeout()};

    const auto started = std::chrono::steady_clock::now();
    auto response = backend_->Generate(request);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    WipeText(request.query);
    WipeTranscript(request.history);

    const auto fallback = [this](std::string_view reason) {
        logging::GetLogger()->warn("Generation unavailable ({}), sending fallback reply", reason);
        return Reply{.text = config_.GetFallbackReply(), .sources = {}, .fallback = true};
    };

    if (response.IsErr()) {
        return fallback(response.UnwrapErr().message);
    }
    auto& generated = response.Unwrap();
    if (elapsed > config_.GetGenerationTimeout()) {
        WipeText(generated.answer);
        return fallback("timed out");
    }
    if (!IsSuccessStatus(generated.status_code)) {
        WipeText(generated.answer);
        return fallback(compat::format("status {}", generated.status_code));
    }
    if (generated.answer.empty()) {
        return fallback("empty answer");
    }
    return Reply{.text = std::move(generated.answer), .sources = std::move(generated.sources), .fallback = false};
}

Result<ChatTurnResponse, VaultFailure> MessagePipeline::ProcessTurn(
    std::string_view owner_id,
    const ChatTurnRequest& request,
    std::stop_token stop) {
    using R = Result<ChatTurnResponse, VaultFailure>;
    auto log = logging::GetLogger();

    if (auto valid = models::ValidateOwnerId(owner_id); valid.IsErr()) {
        return R::Err(valid.UnwrapErr());
    }

    // Received
    auto received = Receive(request);
    if (received.IsErr()) {
        return R::Err(received.UnwrapErr());
    }
    InboundTurn inbound = std::move(received).Unwrap();
    log->debug("Turn received");

    // Stored(user-turn)
    std::string session_id;
    if (inbound.session_id.has_value()) {
        session_id = std::move(*inbound.session_id);
    } else {
        auto created = repository_->CreateSession(owner_id, std::nullopt);
        if (created.IsErr()) {
            WipeText(inbound.plaintext);
            return R::Err(created.UnwrapErr());
        }
        session_id = std::move(created).Unwrap();
    }

    auto title_candidate = DeriveTitle(inbound.plaintext, config_.GetTitleMaxLength(),
                                       config_.GetTitleTruncationMarker());
    auto stored_user = repository_->AppendMessage(
        session_id, owner_id,
        models::NewMessage{
            .role = MessageRole::User,
            .ciphertext = std::move(inbound.ciphertext),
            .metadata = inbound.metadata,
            .content_hash = std::move(inbound.content_hash),
            .sources = {}},
        std::move(title_candidate));
    if (stored_user.IsErr()) {
        WipeText(inbound.plaintext);
        return R::Err(stored_user.UnwrapErr());
    }
    log->debug("User turn stored in session {}", session_id);

    if (stop.stop_requested()) {
        WipeText(inbound.plaintext);
        return CancelledTurn(session_id);
    }

    // ContextBuilt
    auto context = BuildContext(session_id, owner_id, stored_user.Unwrap().id);
    if (context.IsErr()) {
        WipeText(inbound.plaintext);
        return R::Err(context.UnwrapErr());
    }
    log->debug("Context built from {} prior messages", context.Unwrap().size());

    if (stop.stop_requested()) {
        WipeText(inbound.plaintext);
        WipeTranscript(context.Unwrap());
        return CancelledTurn(session_id);
    }

    // GenerationAttempted
    Reply reply = Generate(inbound.plaintext, std::move(context).Unwrap());
    WipeText(inbound.plaintext);
    log->debug("Generation attempted (fallback: {})", reply.fallback);

    if (stop.stop_requested()) {
        WipeText(reply.text);
        return CancelledTurn(session_id);
    }

    // Stored(bot-turn)
    auto sealed = codec_->Encrypt(reply.text, inbound.metadata);
    WipeText(reply.text);
    if (sealed.IsErr()) {
        log->error("Failed to encrypt reply: {}", sealed.UnwrapErr().message);
        return R::Err(sealed.UnwrapErr());
    }
    auto payload = std::move(sealed).Unwrap();
    std::string content_hash = ContentHash::Compute(payload.ciphertext);
    std::string encrypted_response = Encoding::ToBase64(payload.ciphertext);

    auto stored_bot = repository_->AppendMessage(
        session_id, owner_id,
        models::NewMessage{
            .role = MessageRole::Bot,
            .ciphertext = std::move(payload.ciphertext),
            .metadata = payload.metadata,
            .content_hash = content_hash,
            .sources = reply.sources},
        std::nullopt);
    if (stored_bot.IsErr()) {
        return R::Err(stored_bot.UnwrapErr());
    }
    log->debug("Bot turn stored in session {}", session_id);

    // Returned
    return R::Ok(ChatTurnResponse{
        .session_id = std::move(session_id),
        .encrypted_response = std::move(encrypted_response),
        .encryption_metadata = std::move(payload.metadata),
        .content_hash = std::move(content_hash),
        .sources = std::move(reply.sources)});
}

Result<std::vector<MessageRecord>, VaultFailure> MessagePipeline::GetHistory(
    std::string_view owner_id,
    std::string_view session_id) {
    return models::NormalizeUuid(session_id).Bind([&](const std::string& id) {
        return repository_->ListMessages(id, owner_id);
    });
}

} // namespace chatvault::pipeline
