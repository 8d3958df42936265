#pragma once
#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"
#include "chatvault/models/session_record.hpp"
#include "chatvault/models/message_record.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace chatvault::interfaces {

/**
 * @brief Ownership-scoped persistence of sessions and their encrypted messages
 *
 * Implementations never see plaintext. A session that does not exist and a
 * session owned by someone else are indistinguishable to the caller: the
 * bool/optional operations report "not found", the others AccessDenied.
 * Every ownership check happens atomically with the mutation it guards.
 */
class ISessionRepository {
public:
    virtual ~ISessionRepository() = default;

    /// Empty or absent title falls back to the store's default title
    [[nodiscard]] virtual Result<std::string, VaultFailure> CreateSession(
        std::string_view owner_id,
        std::optional<std::string> title) = 0;

    [[nodiscard]] virtual Result<std::optional<models::SessionRecord>, VaultFailure> GetSession(
        std::string_view session_id,
        std::string_view owner_id) = 0;

    /// Most recently updated first; limit must be in [1, max page size]
    [[nodiscard]] virtual Result<std::vector<models::SessionSummary>, VaultFailure> ListSessions(
        std::string_view owner_id,
        uint32_t limit,
        uint32_t offset) = 0;

    /// Removes the session and all its messages
    [[nodiscard]] virtual Result<bool, VaultFailure> DeleteSession(
        std::string_view session_id,
        std::string_view owner_id) = 0;

    [[nodiscard]] virtual Result<bool, VaultFailure> UpdateTitle(
        std::string_view session_id,
        std::string_view owner_id,
        std::string title) = 0;

    /// @p title_candidate replaces the title only on the first user message
    /// of a session whose title is still the default
    [[nodiscard]] virtual Result<models::MessageRecord, VaultFailure> AppendMessage(
        std::string_view session_id,
        std::string_view owner_id,
        models::NewMessage message,
        std::optional<std::string> title_candidate) = 0;

    /// Insertion order
    [[nodiscard]] virtual Result<std::vector<models::MessageRecord>, VaultFailure> ListMessages(
        std::string_view session_id,
        std::string_view owner_id) = 0;

    [[nodiscard]] virtual Result<bool, VaultFailure> UpdateSessionData(
        std::string_view session_id,
        std::string_view owner_id,
        models::EncryptedBlob session_data) = 0;

    [[nodiscard]] virtual Result<std::optional<models::EncryptedBlob>, VaultFailure> GetSessionData(
        std::string_view session_id,
        std::string_view owner_id) = 0;

    [[nodiscard]] virtual Result<size_t, VaultFailure> CountMessages(
        std::string_view session_id,
        std::string_view owner_id) = 0;
};
}
