#pragma once

#include "chatvault/c_api/cv_export.h"

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

#define CV_API_VERSION_MAJOR 1
#define CV_API_VERSION_MINOR 0
#define CV_API_VERSION_PATCH 0

/* Codes 1..11 mirror VaultFailureType one to one. */
typedef enum {
    CV_SUCCESS = 0,
    CV_ERROR_GENERIC = 1,
    CV_ERROR_INVALID_INPUT = 2,
    CV_ERROR_VALIDATION = 3,
    CV_ERROR_ACCESS_DENIED = 4,
    CV_ERROR_INTEGRITY = 5,
    CV_ERROR_DECRYPTION = 6,
    CV_ERROR_ENCRYPTION = 7,
    CV_ERROR_DERIVE_KEY = 8,
    CV_ERROR_STORAGE = 9,
    CV_ERROR_UPSTREAM_UNAVAILABLE = 10,
    CV_ERROR_CANCELLED = 11,
    CV_ERROR_NULL_POINTER = 12,
    CV_ERROR_OUT_OF_MEMORY = 13,
    CV_ERROR_SODIUM_FAILURE = 14,
    CV_ERROR_DECODE = 15
} CvErrorCode;

typedef struct CvVaultHandle CvVaultHandle;

typedef struct CvBuffer {
    uint8_t* data;
    size_t length;
} CvBuffer;

typedef struct CvError {
    CvErrorCode code;
    char* message;
} CvError;

/*
 * Generation backend supplied by the host.
 *
 * request: serialized chatvault.proto.GenerationRequest (plaintext, wiped after the call).
 * out_reply: fill with a serialized chatvault.proto.GenerationReply allocated with malloc();
 *            the library wipes and frees it.
 * Return 0 on success; any other value is a transport failure and produces the fallback reply.
 * The callback must return within the request's timeout_ms. A late reply is discarded, but the
 * library cannot interrupt the call, so a callback that never returns blocks the turn.
 */
typedef int32_t (*CvGenerateCallback)(
    const uint8_t* request,
    size_t request_length,
    CvBuffer* out_reply,
    void* user_data);

typedef struct CvVaultOptions {
    /* NULL or "" keeps sessions in memory; otherwise an SQLite database path. */
    const char* database_path;
    /* 32 bytes derives per key_id keys with HKDF; NULL uses the placeholder key table. */
    const uint8_t* master_key;
    size_t master_key_length;
    /* NULL means every turn gets the fallback reply. */
    CvGenerateCallback generate;
    void* generate_user_data;
    /* 0 keeps the configured default. */
    uint32_t generation_timeout_ms;
} CvVaultOptions;

CV_API const char* cv_version(void);

CV_API CvErrorCode cv_init(void);

CV_API CvErrorCode cv_vault_open(
    const CvVaultOptions* options,
    CvVaultHandle** out_handle,
    CvError* out_error);

CV_API void cv_vault_close(CvVaultHandle* handle);

/* request: serialized ChatTurnRequest; out_response: serialized ChatTurnResponse. */
CV_API CvErrorCode cv_chat_turn(
    CvVaultHandle* handle,
    const char* owner_id,
    const uint8_t* request,
    size_t request_length,
    CvBuffer* out_response,
    CvError* out_error);

/* out_history: serialized SessionHistory. */
CV_API CvErrorCode cv_get_history(
    CvVaultHandle* handle,
    const char* owner_id,
    const char* session_id,
    CvBuffer* out_history,
    CvError* out_error);

/* limit 0 selects the default page size; out_sessions: serialized SessionList. */
CV_API CvErrorCode cv_list_sessions(
    CvVaultHandle* handle,
    const char* owner_id,
    uint32_t limit,
    uint32_t offset,
    CvBuffer* out_sessions,
    CvError* out_error);

/* title may be NULL. out_session_id receives the UUID text (not NUL-terminated). */
CV_API CvErrorCode cv_create_session(
    CvVaultHandle* handle,
    const char* owner_id,
    const char* title,
    CvBuffer* out_session_id,
    CvError* out_error);

CV_API CvErrorCode cv_delete_session(
    CvVaultHandle* handle,
    const char* owner_id,
    const char* session_id,
    bool* out_deleted,
    CvError* out_error);

CV_API CvErrorCode cv_update_title(
    CvVaultHandle* handle,
    const char* owner_id,
    const char* session_id,
    const char* title,
    bool* out_updated,
    CvError* out_error);

/* Wipes and releases the data of a buffer filled by the library; the struct itself is caller-owned. */
CV_API void cv_buffer_free(CvBuffer* buffer);

CV_API void cv_error_free(CvError* error);

CV_API const char* cv_error_string(CvErrorCode code);

#ifdef __cplusplus
}
#endif
