#include "chatvault/c_api/chatvault_c_api.h"
#include "cv_internal.hpp"
#include "chatvault/configuration/vault_config.hpp"
#include "chatvault/crypto/message_codec.hpp"
#include "chatvault/crypto/sodium_interop.hpp"
#include "chatvault/keys/derived_key_provider.hpp"
#include "chatvault/keys/static_key_provider.hpp"
#include "chatvault/logging/logger.hpp"
#include "chatvault/models/identifiers.hpp"
#include "chatvault/storage/in_memory_session_store.hpp"
#include "chatvault/storage/sqlite_session_store.hpp"
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <span>
#include <string>

using namespace chatvault;
using namespace cv::internal;
using chatvault::crypto::SodiumInterop;

namespace {

Result<std::shared_ptr<interfaces::IKeyProvider>, VaultFailure> BuildKeyProvider(const CvVaultOptions& options) {
    using R = Result<std::shared_ptr<interfaces::IKeyProvider>, VaultFailure>;
    if (options.master_key) {
        auto derived = keys::DerivedKeyProvider::Create(
            std::span<const uint8_t>(options.master_key, options.master_key_length));
        if (derived.IsErr()) {
            return R::Err(derived.UnwrapErr());
        }
        return R::Ok(std::shared_ptr<interfaces::IKeyProvider>(std::move(derived).Unwrap()));
    }
    auto placeholder = keys::StaticKeyProvider::Placeholder();
    if (placeholder.IsErr()) {
        return R::Err(placeholder.UnwrapErr());
    }
    return R::Ok(std::shared_ptr<interfaces::IKeyProvider>(std::move(placeholder).Unwrap()));
}

Result<std::shared_ptr<interfaces::ISessionRepository>, VaultFailure> BuildRepository(
    const configuration::VaultConfig& config) {
    using R = Result<std::shared_ptr<interfaces::ISessionRepository>, VaultFailure>;
    const auto store_options = storage::StoreOptions::FromConfig(config);
    if (config.IsInMemory()) {
        return R::Ok(std::make_shared<storage::InMemorySessionStore>(store_options));
    }
    auto opened = storage::SqliteSessionStore::Open(config.GetDatabasePath(), store_options);
    if (opened.IsErr()) {
        return R::Err(opened.UnwrapErr());
    }
    return R::Ok(std::shared_ptr<interfaces::ISessionRepository>(std::move(opened).Unwrap()));
}

bool validate_handle(const CvVaultHandle* handle, CvError* out_error) {
    if (!handle || !handle->pipeline || !handle->repository) {
        fill_error(out_error, CV_ERROR_NULL_POINTER, "Vault handle is null or closed");
        return false;
    }
    return true;
}

CvErrorCode fail_with_exception(CvError* out_error, const std::exception& ex) {
    fill_error(out_error, CV_ERROR_GENERIC, std::string("Unexpected exception: ") + ex.what());
    return CV_ERROR_GENERIC;
}

} // namespace

extern "C" {

// ----------------------------------------------------------------------------
// Version & Initialization
// ----------------------------------------------------------------------------

const char* cv_version(void) {
    return "1.0.0";
}

CvErrorCode cv_init(void) {
    return EnsureInitialized();
}

// ----------------------------------------------------------------------------
// Vault lifecycle
// ----------------------------------------------------------------------------

CvErrorCode cv_vault_open(
    const CvVaultOptions* options,
    CvVaultHandle** out_handle,
    CvError* out_error) {
    if (const auto err = EnsureInitialized(); err != CV_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!validate_pointer(options, "Options", out_error) ||
        !validate_pointer(out_handle, "Output handle pointer", out_error) ||
        !validate_buffer_param(options->master_key, options->master_key_length, out_error)) {
        return CV_ERROR_NULL_POINTER;
    }
    *out_handle = nullptr;

    try {
        auto config_result = configuration::VaultConfig::FromEnvironment();
        if (config_result.IsErr()) {
            return fill_error_from_failure(out_error, config_result.UnwrapErr());
        }
        auto config = std::move(config_result).Unwrap();
        if (options->database_path && options->database_path[0] != '\0') {
            config = config.WithDatabasePath(options->database_path);
        }
        if (options->generation_timeout_ms > 0) {
            config = config.WithGenerationTimeout(std::chrono::milliseconds(options->generation_timeout_ms));
        }
        logging::Configure(config);

        auto key_provider = BuildKeyProvider(*options);
        if (key_provider.IsErr()) {
            return fill_error_from_failure(out_error, key_provider.UnwrapErr());
        }
        auto repository = BuildRepository(config);
        if (repository.IsErr()) {
            return fill_error_from_failure(out_error, repository.UnwrapErr());
        }

        auto handle = std::make_unique<CvVaultHandle>();
        handle->repository = std::move(repository).Unwrap();
        handle->pipeline = std::make_unique<pipeline::MessagePipeline>(
            handle->repository,
            std::make_shared<crypto::MessageCodec>(std::move(key_provider).Unwrap()),
            std::make_shared<CallbackGenerationBackend>(options->generate, options->generate_user_data),
            std::move(config));
        *out_handle = handle.release();
        return CV_SUCCESS;
    } catch (const std::exception& ex) {
        return fail_with_exception(out_error, ex);
    }
}

void cv_vault_close(CvVaultHandle* handle) {
    delete handle;
}

// ----------------------------------------------------------------------------
// Chat turns and history
// ----------------------------------------------------------------------------

CvErrorCode cv_chat_turn(
    CvVaultHandle* handle,
    const char* owner_id,
    const uint8_t* request,
    const size_t request_length,
    CvBuffer* out_response,
    CvError* out_error) {
    if (!validate_handle(handle, out_error) ||
        !validate_pointer(owner_id, "Owner id", out_error) ||
        !validate_buffer_param(request, request_length, out_error) ||
        !validate_pointer(out_response, "Output buffer", out_error)) {
        return CV_ERROR_NULL_POINTER;
    }

    try {
        proto::ChatTurnRequest wire;
        if (!wire.ParseFromArray(request, static_cast<int>(request_length))) {
            fill_error(out_error, CV_ERROR_DECODE, "Failed to parse ChatTurnRequest");
            return CV_ERROR_DECODE;
        }
        models::ChatTurnRequest turn{
            .encrypted_message = wire.encrypted_message(),
            .encryption_metadata = from_proto(wire.encryption_metadata()),
            .content_hash = wire.content_hash(),
            .session_id = wire.has_session_id() ? std::optional<std::string>(wire.session_id()) : std::nullopt};

        auto result = handle->pipeline->ProcessTurn(owner_id, turn);
        if (result.IsErr()) {
            return fill_error_from_failure(out_error, result.UnwrapErr());
        }
        const auto& response = result.Unwrap();

        proto::ChatTurnResponse reply;
        reply.set_session_id(response.session_id);
        reply.set_encrypted_response(response.encrypted_response);
        to_proto(response.encryption_metadata, reply.mutable_encryption_metadata());
        reply.set_content_hash(response.content_hash);
        for (const auto& source : response.sources) {
            reply.add_sources(source);
        }
        if (!serialize_to_buffer(reply, out_response, out_error)) {
            return out_error ? out_error->code : CV_ERROR_DECODE;
        }
        return CV_SUCCESS;
    } catch (const std::exception& ex) {
        return fail_with_exception(out_error, ex);
    }
}

CvErrorCode cv_get_history(
    CvVaultHandle* handle,
    const char* owner_id,
    const char* session_id,
    CvBuffer* out_history,
    CvError* out_error) {
    if (!validate_handle(handle, out_error) ||
        !validate_pointer(owner_id, "Owner id", out_error) ||
        !validate_pointer(session_id, "Session id", out_error) ||
        !validate_pointer(out_history, "Output buffer", out_error)) {
        return CV_ERROR_NULL_POINTER;
    }

    try {
        auto messages = handle->pipeline->GetHistory(owner_id, session_id);
        if (messages.IsErr()) {
            return fill_error_from_failure(out_error, messages.UnwrapErr());
        }
        proto::SessionHistory history;
        history.set_session_id(session_id);
        for (const auto& message : messages.Unwrap()) {
            to_proto(message, history.add_messages());
        }
        if (!serialize_to_buffer(history, out_history, out_error)) {
            return out_error ? out_error->code : CV_ERROR_DECODE;
        }
        return CV_SUCCESS;
    } catch (const std::exception& ex) {
        return fail_with_exception(out_error, ex);
    }
}

// ----------------------------------------------------------------------------
// Session management
// ----------------------------------------------------------------------------

CvErrorCode cv_list_sessions(
    CvVaultHandle* handle,
    const char* owner_id,
    const uint32_t limit,
    const uint32_t offset,
    CvBuffer* out_sessions,
    CvError* out_error) {
    if (!validate_handle(handle, out_error) ||
        !validate_pointer(owner_id, "Owner id", out_error) ||
        !validate_pointer(out_sessions, "Output buffer", out_error)) {
        return CV_ERROR_NULL_POINTER;
    }

    try {
        const uint32_t page_size = limit == 0 ? handle->pipeline->Config().GetDefaultPageSize() : limit;
        auto sessions = handle->repository->ListSessions(owner_id, page_size, offset);
        if (sessions.IsErr()) {
            return fill_error_from_failure(out_error, sessions.UnwrapErr());
        }
        proto::SessionList list;
        for (const auto& summary : sessions.Unwrap()) {
            auto* entry = list.add_sessions();
            entry->set_id(summary.id);
            entry->set_title(summary.title);
            entry->set_created_at(models::FormatIso8601(summary.created_at));
            entry->set_updated_at(models::FormatIso8601(summary.updated_at));
            entry->set_message_count(summary.message_count);
        }
        if (!serialize_to_buffer(list, out_sessions, out_error)) {
            return out_error ? out_error->code : CV_ERROR_DECODE;
        }
        return CV_SUCCESS;
    } catch (const std::exception& ex) {
        return fail_with_exception(out_error, ex);
    }
}

CvErrorCode cv_create_session(
    CvVaultHandle* handle,
    const char* owner_id,
    const char* title,
    CvBuffer* out_session_id,
    CvError* out_error) {
    if (!validate_handle(handle, out_error) ||
        !validate_pointer(owner_id, "Owner id", out_error) ||
        !validate_pointer(out_session_id, "Output buffer", out_error)) {
        return CV_ERROR_NULL_POINTER;
    }

    try {
        std::optional<std::string> requested_title;
        if (title) {
            requested_title = std::string(title);
        }
        auto created = handle->repository->CreateSession(owner_id, std::move(requested_title));
        if (created.IsErr()) {
            return fill_error_from_failure(out_error, created.UnwrapErr());
        }
        const auto& id = created.Unwrap();
        if (!copy_to_buffer(std::span(reinterpret_cast<const uint8_t*>(id.data()), id.size()),
                            out_session_id, out_error)) {
            return out_error ? out_error->code : CV_ERROR_OUT_OF_MEMORY;
        }
        return CV_SUCCESS;
    } catch (const std::exception& ex) {
        return fail_with_exception(out_error, ex);
    }
}

CvErrorCode cv_delete_session(
    CvVaultHandle* handle,
    const char* owner_id,
    const char* session_id,
    bool* out_deleted,
    CvError* out_error) {
    if (!validate_handle(handle, out_error) ||
        !validate_pointer(owner_id, "Owner id", out_error) ||
        !validate_pointer(session_id, "Session id", out_error) ||
        !validate_pointer(out_deleted, "Output flag", out_error)) {
        return CV_ERROR_NULL_POINTER;
    }

    try {
        auto deleted = models::NormalizeUuid(session_id).Bind([&](const std::string& id) {
            return handle->repository->DeleteSession(id, owner_id);
        });
        if (deleted.IsErr()) {
            return fill_error_from_failure(out_error, deleted.UnwrapErr());
        }
        *out_deleted = deleted.Unwrap();
        return CV_SUCCESS;
    } catch (const std::exception& ex) {
        return fail_with_exception(out_error, ex);
    }
}

CvErrorCode cv_update_title(
    CvVaultHandle* handle,
    const char* owner_id,
    const char* session_id,
    const char* title,
    bool* out_updated,
    CvError* out_error) {
    if (!validate_handle(handle, out_error) ||
        !validate_pointer(owner_id, "Owner id", out_error) ||
        !validate_pointer(session_id, "Session id", out_error) ||
        !validate_pointer(title, "Title", out_error) ||
        !validate_pointer(out_updated, "Output flag", out_error)) {
        return CV_ERROR_NULL_POINTER;
    }

    try {
        auto updated = models::NormalizeUuid(session_id).Bind([&](const std::string& id) {
            return handle->repository->UpdateTitle(id, owner_id, title);
        });
        if (updated.IsErr()) {
            return fill_error_from_failure(out_error, updated.UnwrapErr());
        }
        *out_updated = updated.Unwrap();
        return CV_SUCCESS;
    } catch (const std::exception& ex) {
        return fail_with_exception(out_error, ex);
    }
}

// ----------------------------------------------------------------------------
// Memory management
// ----------------------------------------------------------------------------

void cv_buffer_free(CvBuffer* buffer) {
    if (buffer && buffer->data) {
        auto wipe = SodiumInterop::SecureWipe(std::span(buffer->data, buffer->length));
        (void)wipe;
        delete[] buffer->data;
        buffer->data = nullptr;
        buffer->length = 0;
    }
}

void cv_error_free(CvError* error) {
    if (error && error->message) {
        free(error->message);
        error->message = nullptr;
    }
}

const char* cv_error_string(const CvErrorCode code) {
    switch (code) {
        case CV_SUCCESS: return "Success";
        case CV_ERROR_GENERIC: return "Generic error";
        case CV_ERROR_INVALID_INPUT: return "Invalid input";
        case CV_ERROR_VALIDATION: return "Validation failed";
        case CV_ERROR_ACCESS_DENIED: return "Session not found or access denied";
        case CV_ERROR_INTEGRITY: return "Content hash mismatch";
        case CV_ERROR_DECRYPTION: return "Decryption failed";
        case CV_ERROR_ENCRYPTION: return "Encryption failed";
        case CV_ERROR_DERIVE_KEY: return "Key derivation failed";
        case CV_ERROR_STORAGE: return "Storage failure";
        case CV_ERROR_UPSTREAM_UNAVAILABLE: return "Generation backend unavailable";
        case CV_ERROR_CANCELLED: return "Cancelled";
        case CV_ERROR_NULL_POINTER: return "Null pointer";
        case CV_ERROR_OUT_OF_MEMORY: return "Out of memory";
        case CV_ERROR_SODIUM_FAILURE: return "Libsodium failure";
        case CV_ERROR_DECODE: return "Decode failed";
    }
    return "Unknown error";
}

} // extern "C"
