#pragma once

#include "chatvault/interfaces/i_session_repository.hpp"
#include "chatvault/storage/store_options.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chatvault::storage {

/**
 * @brief Volatile ISessionRepository behind a single mutex
 *
 * Owned by whoever constructs it; there is no process-wide instance. Useful
 * for tests and for hosts that keep chat history for the process lifetime only.
 */
class InMemorySessionStore final : public interfaces::ISessionRepository {
public:
    explicit InMemorySessionStore(StoreOptions options = {});

    Result<std::string, VaultFailure> CreateSession(
        std::string_view owner_id, std::optional<std::string> title) override;

    Result<std::optional<models::SessionRecord>, VaultFailure> GetSession(
        std::string_view session_id, std::string_view owner_id) override;

    Result<std::vector<models::SessionSummary>, VaultFailure> ListSessions(
        std::string_view owner_id, uint32_t limit, uint32_t offset) override;

    Result<bool, VaultFailure> DeleteSession(
        std::string_view session_id, std::string_view owner_id) override;

    Result<bool, VaultFailure> UpdateTitle(
        std::string_view session_id, std::string_view owner_id, std::string title) override;

    Result<models::MessageRecord, VaultFailure> AppendMessage(
        std::string_view session_id,
        std::string_view owner_id,
        models::NewMessage message,
        std::optional<std::string> title_candidate) override;

    Result<std::vector<models::MessageRecord>, VaultFailure> ListMessages(
        std::string_view session_id, std::string_view owner_id) override;

    Result<bool, VaultFailure> UpdateSessionData(
        std::string_view session_id, std::string_view owner_id, models::EncryptedBlob session_data) override;

    Result<std::optional<models::EncryptedBlob>, VaultFailure> GetSessionData(
        std::string_view session_id, std::string_view owner_id) override;

    Result<size_t, VaultFailure> CountMessages(
        std::string_view session_id, std::string_view owner_id) override;

private:
    struct SessionEntry {
        models::SessionRecord record;
        std::vector<models::MessageRecord> messages;
        uint64_t touch_sequence = 0;
        bool has_user_message = false;
    };

    // Caller holds mutex_. nullptr when missing or owned by someone else.
    SessionEntry* FindOwned(std::string_view session_id, std::string_view owner_id);

    void Touch(SessionEntry& entry);

    StoreOptions options_;
    std::mutex mutex_;
    std::unordered_map<std::string, SessionEntry> sessions_;
    uint64_t next_message_sequence_ = 1;
    uint64_t next_touch_sequence_ = 1;
};

} // namespace chatvault::storage
