#pragma once

#include "chatvault/interfaces/i_session_repository.hpp"
#include "chatvault/storage/store_options.hpp"

#include <memory>
#include <mutex>
#include <string>

struct sqlite3;

namespace chatvault::storage {

namespace detail {

struct Sqlite3Deleter {
    void operator()(sqlite3* db) const noexcept;
};
using DatabasePtr = std::unique_ptr<sqlite3, Sqlite3Deleter>;

} // namespace detail

/**
 * @brief Durable ISessionRepository on a single SQLite connection
 *
 * The connection is serialized by a mutex and every operation runs inside
 * BEGIN IMMEDIATE ... COMMIT, so the ownership check and the write it guards
 * see the same snapshot. Tables are created on open when absent; there is no
 * migration support. Pass ":memory:" for a private in-memory database.
 */
class SqliteSessionStore final : public interfaces::ISessionRepository {
public:
    static Result<std::unique_ptr<SqliteSessionStore>, VaultFailure> Open(
        const std::string& path, StoreOptions options = {});

    ~SqliteSessionStore() override;

    SqliteSessionStore(const SqliteSessionStore&) = delete;
    SqliteSessionStore& operator=(const SqliteSessionStore&) = delete;

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
    SqliteSessionStore(detail::DatabasePtr db, StoreOptions options) noexcept;

    Result<Unit, VaultFailure> Execute(const char* sql);
    Result<Unit, VaultFailure> InitializeSchema();

    template<typename T, typename F>
    Result<T, VaultFailure> InTransaction(F&& body);

    Result<bool, VaultFailure> IsOwned(std::string_view session_id, std::string_view owner_id);
    Result<Unit, VaultFailure> Touch(std::string_view session_id);

    detail::DatabasePtr db_;
    StoreOptions options_;
    std::mutex mutex_;
};

} // namespace chatvault::storage
