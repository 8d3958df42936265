#pragma once

#include "chatvault/models/encryption_metadata.hpp"

#include <optional>
#include <string>
#include <vector>

namespace chatvault::models {

/**
 * @brief One user turn as received from the routing layer
 *
 * All fields are untrusted. encrypted_message is base64, content_hash is the
 * hex SHA-256 the client claims for the decoded ciphertext. No session_id
 * means "start a new session".
 */
struct ChatTurnRequest {
    std::string encrypted_message;
    MetadataFields encryption_metadata;
    std::string content_hash;
    std::optional<std::string> session_id;
};

/** The stored bot turn, ready to hand back to the client. */
struct ChatTurnResponse {
    std::string session_id;
    std::string encrypted_response;
    EncryptionMetadata encryption_metadata;
    std::string content_hash;
    std::vector<std::string> sources;
};

} // namespace chatvault::models
