#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"
#include "chatvault/core/constants.hpp"
#include "chatvault/core/format.hpp"
#include "chatvault/models/message_record.hpp"
#include "chatvault/models/identifiers.hpp"
#include "chatvault/models/session_record.hpp"

#include <optional>
#include <string>
#include <string_view>

// Rules shared by every ISessionRepository implementation.
namespace chatvault::storage::detail {

inline Result<Unit, VaultFailure> ValidatePage(const uint32_t limit, const uint32_t max_page_size) {
    if (limit == 0 || limit > max_page_size) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::Validation(
            compat::format("Page limit must be between 1 and {}, got {}", max_page_size, limit)));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

inline std::string ResolveTitle(std::optional<std::string> title, const std::string& default_title) {
    if (!title.has_value() || title->empty()) {
        return default_title;
    }
    return std::move(*title);
}

/// Only the first user message may name a session, and only while it still
/// carries the default title
inline bool ShouldAdoptTitle(const models::MessageRole role,
                             const bool has_user_message,
                             const std::string& current_title,
                             const std::string& default_title,
                             const std::optional<std::string>& candidate) {
    return role == models::MessageRole::User &&
           !has_user_message &&
           current_title == default_title &&
           candidate.has_value() && !candidate->empty();
}

/// Metadata must survive the round trip through its wire form, or stored
/// rows would fail to load later
inline Result<Unit, VaultFailure> ValidateStoredMetadata(const models::EncryptionMetadata& metadata) {
    auto parsed = models::EncryptionMetadata::Parse(metadata.ToFields());
    if (parsed.IsErr()) {
        return Result<Unit, VaultFailure>::Err(parsed.UnwrapErr());
    }
    if (metadata.iv.empty()) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::Validation("Encryption metadata has an empty iv"));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

inline Result<Unit, VaultFailure> ValidateNewMessage(const models::NewMessage& message) {
    if (message.content_hash.size() != Constants::SHA_256_HEX_SIZE) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::Validation("Content hash must be 64 hex characters"));
    }
    return ValidateStoredMetadata(message.metadata);
}

inline Result<Unit, VaultFailure> ValidateBlob(const models::EncryptedBlob& blob) {
    if (blob.ciphertext.empty()) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::Validation("Session data ciphertext must not be empty"));
    }
    return ValidateStoredMetadata(blob.metadata);
}

} // namespace chatvault::storage::detail
