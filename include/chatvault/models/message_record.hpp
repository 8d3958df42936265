#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"
#include "chatvault/models/encryption_metadata.hpp"
#include "chatvault/models/timestamp.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chatvault::models {

enum class MessageRole : uint8_t {
    User,
    Bot
};

/** "user" / "bot" */
[[nodiscard]] std::string_view RoleTag(MessageRole role) noexcept;

[[nodiscard]] Result<MessageRole, VaultFailure> ParseRole(std::string_view tag);

/** A turn as handed to the store; the store assigns id, timestamp and sequence. */
struct NewMessage {
    MessageRole role = MessageRole::User;
    std::vector<uint8_t> ciphertext;
    EncryptionMetadata metadata;
    std::string content_hash;
    std::vector<std::string> sources;
};

struct MessageRecord {
    std::string id;
    std::string session_id;
    MessageRole role = MessageRole::User;
    std::vector<uint8_t> ciphertext;
    EncryptionMetadata metadata;
    std::string content_hash;
    std::vector<std::string> sources;
    Timestamp created_at;
    // Strictly increasing per store; ties in created_at are ordered by it
    uint64_t sequence = 0;
};

} // namespace chatvault::models
