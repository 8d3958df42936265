#pragma once

#include "chatvault/models/encryption_metadata.hpp"
#include "chatvault/models/timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chatvault::models {

/** Opaque ciphertext with the metadata needed to decrypt it. */
struct EncryptedBlob {
    std::vector<uint8_t> ciphertext;
    EncryptionMetadata metadata;
};

struct SessionRecord {
    std::string id;
    std::string owner_id;
    std::string title;
    std::optional<EncryptedBlob> session_data;
    Timestamp created_at;
    Timestamp updated_at;
};

/** Listing row: the session without its blob, plus an aggregate count. */
struct SessionSummary {
    std::string id;
    std::string owner_id;
    std::string title;
    Timestamp created_at;
    Timestamp updated_at;
    size_t message_count = 0;
};

} // namespace chatvault::models
