#include "chatvault/storage/sqlite_session_store.hpp"
#include "chatvault/logging/logger.hpp"
#include "sqlite_statement.hpp"
#include "store_rules.hpp"

#include "chatvault/vault.pb.h"

#include <algorithm>
#include <limits>

namespace chatvault::storage {

using detail::Statement;
using detail::StorageError;
using models::EncryptedBlob;
using models::MessageRecord;
using models::SessionRecord;
using models::SessionSummary;

namespace {

constexpr const char* SCHEMA_SQL = R"sql(
CREATE TABLE IF NOT EXISTS sessions (
    seq INTEGER PRIMARY KEY AUTOINCREMENT,
    id TEXT NOT NULL UNIQUE,
    owner_id TEXT NOT NULL,
    title TEXT NOT NULL,
    session_data BLOB NULL,
    session_data_algorithm TEXT NULL,
    session_data_key_id TEXT NULL,
    session_data_iv TEXT NULL,
    session_data_created_at TEXT NULL,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL,
    touch_seq INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS messages (
    seq INTEGER PRIMARY KEY AUTOINCREMENT,
    id TEXT NOT NULL UNIQUE,
    session_id TEXT NOT NULL REFERENCES sessions(id) ON DELETE CASCADE,
    role TEXT NOT NULL CHECK (role IN ('user', 'bot')),
    ciphertext BLOB NOT NULL,
    algorithm TEXT NOT NULL,
    key_id TEXT NOT NULL,
    iv TEXT NOT NULL,
    metadata_created_at TEXT NOT NULL,
    content_hash TEXT NOT NULL,
    auxiliary BLOB NULL,
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_sessions_owner_updated ON sessions(owner_id, updated_at);
CREATE INDEX IF NOT EXISTS idx_messages_session_seq ON messages(session_id, seq);
)sql";

constexpr const char* NEXT_TOUCH_SQL = "(SELECT COALESCE(MAX(touch_seq), 0) + 1 FROM sessions)";

Result<std::vector<uint8_t>, VaultFailure> EncodeAuxiliary(const std::vector<std::string>& sources) {
    proto::MessageAuxiliary auxiliary;
    for (const auto& source : sources) {
        auxiliary.add_sources(source);
    }
    std::vector<uint8_t> bytes(auxiliary.ByteSizeLong());
    if (!auxiliary.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::Storage("Failed to serialize message auxiliary data"));
    }
    return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(bytes));
}

Result<std::vector<std::string>, VaultFailure> DecodeAuxiliary(const std::vector<uint8_t>& bytes) {
    proto::MessageAuxiliary auxiliary;
    if (!auxiliary.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<std::vector<std::string>, VaultFailure>::Err(
            VaultFailure::Storage("Stored message auxiliary data is corrupt"));
    }
    return Result<std::vector<std::string>, VaultFailure>::Ok(
        std::vector<std::string>(auxiliary.sources().begin(), auxiliary.sources().end()));
}

Result<models::EncryptionMetadata, VaultFailure> ReadMetadata(const Statement& stmt, const int first_column) {
    auto metadata = models::EncryptionMetadata::Parse(
        stmt.ColumnText(first_column),
        stmt.ColumnText(first_column + 1),
        stmt.ColumnText(first_column + 2),
        stmt.ColumnText(first_column + 3));
    if (metadata.IsErr()) {
        return Result<models::EncryptionMetadata, VaultFailure>::Err(
            VaultFailure::Storage("Stored encryption metadata is corrupt: " + metadata.UnwrapErr().message));
    }
    return metadata;
}

} // namespace

Result<std::unique_ptr<SqliteSessionStore>, VaultFailure> SqliteSessionStore::Open(
    const std::string& path, StoreOptions options) {
    using R = Result<std::unique_ptr<SqliteSessionStore>, VaultFailure>;
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    detail::DatabasePtr db(raw);
    if (rc != SQLITE_OK) {
        return R::Err(StorageError(db.get(), compat::format("Failed to open database '{}'", path)));
    }
    const auto busy_ms = std::min<int64_t>(options.busy_timeout.count(), std::numeric_limits<int>::max());
    sqlite3_busy_timeout(db.get(), static_cast<int>(busy_ms));

    std::unique_ptr<SqliteSessionStore> store(new SqliteSessionStore(std::move(db), std::move(options)));
    if (auto schema = store->InitializeSchema(); schema.IsErr()) {
        return R::Err(schema.UnwrapErr());
    }
    logging::GetLogger()->debug("Opened session database '{}'", path);
    return R::Ok(std::move(store));
}

SqliteSessionStore::SqliteSessionStore(detail::DatabasePtr db, StoreOptions options) noexcept
    : db_(std::move(db)), options_(std::move(options)) {}

SqliteSessionStore::~SqliteSessionStore() = default;

Result<Unit, VaultFailure> SqliteSessionStore::Execute(const char* sql) {
    char* error = nullptr;
    if (sqlite3_exec(db_.get(), sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error != nullptr ? error : sqlite3_errmsg(db_.get());
        sqlite3_free(error);
        return Result<Unit, VaultFailure>::Err(VaultFailure::Storage(message));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<Unit, VaultFailure> SqliteSessionStore::InitializeSchema() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto wal = Execute("PRAGMA journal_mode=WAL;"); wal.IsErr()) {
        return wal;
    }
    if (auto fk = Execute("PRAGMA foreign_keys=ON;"); fk.IsErr()) {
        return fk;
    }
    return Execute(SCHEMA_SQL);
}

template<typename T, typename F>
Result<T, VaultFailure> SqliteSessionStore::InTransaction(F&& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto begin = Execute("BEGIN IMMEDIATE;"); begin.IsErr()) {
        return Result<T, VaultFailure>::Err(begin.UnwrapErr());
    }
    Result<T, VaultFailure> result = std::forward<F>(body)();
    if (result.IsErr()) {
        if (auto rollback = Execute("ROLLBACK;"); rollback.IsErr()) {
            logging::GetLogger()->error("Rollback failed: {}", rollback.UnwrapErr().message);
        }
        return result;
    }
    if (auto commit = Execute("COMMIT;"); commit.IsErr()) {
        if (auto rollback = Execute("ROLLBACK;"); rollback.IsErr()) {
            logging::GetLogger()->error("Rollback failed: {}", rollback.UnwrapErr().message);
        }
        return Result<T, VaultFailure>::Err(commit.UnwrapErr());
    }
    return result;
}

Result<bool, VaultFailure> SqliteSessionStore::IsOwned(std::string_view session_id, std::string_view owner_id) {
    auto stmt = Statement::Prepare(db_.get(), "SELECT 1 FROM sessions WHERE id = ?1 AND owner_id = ?2");
    if (stmt.IsErr()) {
        return Result<bool, VaultFailure>::Err(stmt.UnwrapErr());
    }
    stmt.Unwrap().BindText(1, session_id).BindText(2, owner_id);
    return stmt.Unwrap().Step();
}

Result<Unit, VaultFailure> SqliteSessionStore::Touch(std::string_view session_id) {
    const std::string sql = compat::format(
        "UPDATE sessions SET updated_at = ?1, touch_seq = {} WHERE id = ?2", NEXT_TOUCH_SQL);
    auto stmt = Statement::Prepare(db_.get(), sql);
    if (stmt.IsErr()) {
        return Result<Unit, VaultFailure>::Err(stmt.UnwrapErr());
    }
    stmt.Unwrap().BindInt64(1, models::ToUnixMicros(models::Now())).BindText(2, session_id);
    return stmt.Unwrap().Run();
}

Result<std::string, VaultFailure> SqliteSessionStore::CreateSession(
    std::string_view owner_id, std::optional<std::string> title) {
    if (auto valid = models::ValidateOwnerId(owner_id); valid.IsErr()) {
        return Result<std::string, VaultFailure>::Err(valid.UnwrapErr());
    }
    const std::string resolved_title = detail::ResolveTitle(std::move(title), options_.default_title);

    auto created = InTransaction<std::string>([&]() -> Result<std::string, VaultFailure> {
        std::string id = models::GenerateUuid();
        const int64_t now = models::ToUnixMicros(models::Now());
        const std::string sql = compat::format(
            "INSERT INTO sessions (id, owner_id, title, created_at, updated_at, touch_seq) "
            "VALUES (?1, ?2, ?3, ?4, ?4, {})", NEXT_TOUCH_SQL);
        auto stmt = Statement::Prepare(db_.get(), sql);
        if (stmt.IsErr()) {
            return Result<std::string, VaultFailure>::Err(stmt.UnwrapErr());
        }
        stmt.Unwrap().BindText(1, id).BindText(2, owner_id).BindText(3, resolved_title).BindInt64(4, now);
        if (auto run = stmt.Unwrap().Run(); run.IsErr()) {
            return Result<std::string, VaultFailure>::Err(run.UnwrapErr());
        }
        return Result<std::string, VaultFailure>::Ok(std::move(id));
    });
    if (created.IsOk()) {
        logging::GetLogger()->info("Created session {}", created.Unwrap());
    }
    return created;
}

Result<std::optional<SessionRecord>, VaultFailure> SqliteSessionStore::GetSession(
    std::string_view session_id, std::string_view owner_id) {
    using R = Result<std::optional<SessionRecord>, VaultFailure>;
    return InTransaction<std::optional<SessionRecord>>([&]() -> R {
        auto stmt = Statement::Prepare(db_.get(),
            "SELECT id, owner_id, title, created_at, updated_at, session_data, "
            "session_data_algorithm, session_data_key_id, session_data_iv, session_data_created_at "
            "FROM sessions WHERE id = ?1 AND owner_id = ?2");
        if (stmt.IsErr()) {
            return R::Err(stmt.UnwrapErr());
        }
        auto& query = stmt.Unwrap();
        query.BindText(1, session_id).BindText(2, owner_id);
        auto row = query.Step();
        if (row.IsErr()) {
            return R::Err(row.UnwrapErr());
        }
        if (!row.Unwrap()) {
            return R::Ok(std::nullopt);
        }
        SessionRecord record{
            .id = query.ColumnText(0),
            .owner_id = query.ColumnText(1),
            .title = query.ColumnText(2),
            .session_data = std::nullopt,
            .created_at = models::FromUnixMicros(query.ColumnInt64(3)),
            .updated_at = models::FromUnixMicros(query.ColumnInt64(4))};
        if (!query.ColumnIsNull(5)) {
            auto metadata = ReadMetadata(query, 6);
            if (metadata.IsErr()) {
                return R::Err(metadata.UnwrapErr());
            }
            record.session_data = EncryptedBlob{
                .ciphertext = query.ColumnBlob(5),
                .metadata = std::move(metadata).Unwrap()};
        }
        return R::Ok(std::move(record));
    });
}

Result<std::vector<SessionSummary>, VaultFailure> SqliteSessionStore::ListSessions(
    std::string_view owner_id, const uint32_t limit, const uint32_t offset) {
    using R = Result<std::vector<SessionSummary>, VaultFailure>;
    if (auto valid = detail::ValidatePage(limit, options_.max_page_size); valid.IsErr()) {
        return R::Err(valid.UnwrapErr());
    }
    return InTransaction<std::vector<SessionSummary>>([&]() -> R {
        auto stmt = Statement::Prepare(db_.get(),
            "SELECT s.id, s.owner_id, s.title, s.created_at, s.updated_at, COUNT(m.seq) "
            "FROM sessions s LEFT JOIN messages m ON m.session_id = s.id "
            "WHERE s.owner_id = ?1 "
            "GROUP BY s.seq "
            "ORDER BY s.updated_at DESC, s.touch_seq DESC "
            "LIMIT ?2 OFFSET ?3");
        if (stmt.IsErr()) {
            return R::Err(stmt.UnwrapErr());
        }
        auto& query = stmt.Unwrap();
        query.BindText(1, owner_id).BindInt64(2, limit).BindInt64(3, offset);
        std::vector<SessionSummary> page;
        while (true) {
            auto row = query.Step();
            if (row.IsErr()) {
                return R::Err(row.UnwrapErr());
            }
            if (!row.Unwrap()) {
                break;
            }
            page.push_back(SessionSummary{
                .id = query.ColumnText(0),
                .owner_id = query.ColumnText(1),
                .title = query.ColumnText(2),
                .created_at = models::FromUnixMicros(query.ColumnInt64(3)),
                .updated_at = models::FromUnixMicros(query.ColumnInt64(4)),
                .message_count = static_cast<size_t>(query.ColumnInt64(5))});
        }
        return R::Ok(std::move(page));
    });
}

Result<bool, VaultFailure> SqliteSessionStore::DeleteSession(
    std::string_view session_id, std::string_view owner_id) {
    auto deleted = InTransaction<bool>([&]() -> Result<bool, VaultFailure> {
        auto stmt = Statement::Prepare(db_.get(), "DELETE FROM sessions WHERE id = ?1 AND owner_id = ?2");
        if (stmt.IsErr()) {
            return Result<bool, VaultFailure>::Err(stmt.UnwrapErr());
        }
        stmt.Unwrap().BindText(1, session_id).BindText(2, owner_id);
        if (auto run = stmt.Unwrap().Run(); run.IsErr()) {
            return Result<bool, VaultFailure>::Err(run.UnwrapErr());
        }
        return Result<bool, VaultFailure>::Ok(sqlite3_changes(db_.get()) > 0);
    });
    if (deleted.IsOk() && deleted.Unwrap()) {
        logging::GetLogger()->info("Deleted session {}", session_id);
    }
    return deleted;
}

Result<bool, VaultFailure> SqliteSessionStore::UpdateTitle(
    std::string_view session_id, std::string_view owner_id, std::string title) {
    if (title.empty()) {
        return Result<bool, VaultFailure>::Err(VaultFailure::Validation("Title must not be empty"));
    }
    return InTransaction<bool>([&]() -> Result<bool, VaultFailure> {
        const std::string sql = compat::format(
            "UPDATE sessions SET title = ?1, updated_at = ?2, touch_seq = {} "
            "WHERE id = ?3 AND owner_id = ?4", NEXT_TOUCH_SQL);
        auto stmt = Statement::Prepare(db_.get(), sql);
        if (stmt.IsErr()) {
            return Result<bool, VaultFailure>::Err(stmt.UnwrapErr());
        }
        stmt.Unwrap()
            .BindText(1, title)
            .BindInt64(2, models::ToUnixMicros(models::Now()))
            .BindText(3, session_id)
            .BindText(4, owner_id);
        if (auto run = stmt.Unwrap().Run(); run.IsErr()) {
            return Result<bool, VaultFailure>::Err(run.UnwrapErr());
        }
        return Result<bool, VaultFailure>::Ok(sqlite3_changes(db_.get()) > 0);
    });
}

Result<MessageRecord, VaultFailure> SqliteSessionStore::AppendMessage(
    std::string_view session_id,
    std::string_view owner_id,
    models::NewMessage message,
    std::optional<std::string> title_candidate) {
    using R = Result<MessageRecord, VaultFailure>;
    if (auto valid = detail::ValidateNewMessage(message); valid.IsErr()) {
        return R::Err(valid.UnwrapErr());
    }

    return InTransaction<MessageRecord>([&]() -> R {
        auto lookup = Statement::Prepare(db_.get(),
            "SELECT s.title, "
            "EXISTS (SELECT 1 FROM messages m WHERE m.session_id = s.id AND m.role = 'user') "
            "FROM sessions s WHERE s.id = ?1 AND s.owner_id = ?2");
        if (lookup.IsErr()) {
            return R::Err(lookup.UnwrapErr());
        }
        auto& session = lookup.Unwrap();
        session.BindText(1, session_id).BindText(2, owner_id);
        auto found = session.Step();
        if (found.IsErr()) {
            return R::Err(found.UnwrapErr());
        }
        if (!found.Unwrap()) {
            return R::Err(VaultFailure::AccessDenied());
        }
        const std::string current_title = session.ColumnText(0);
        const bool has_user_message = session.ColumnInt64(1) != 0;

        MessageRecord record{
            .id = models::GenerateUuid(),
            .session_id = std::string(session_id),
            .role = message.role,
            .ciphertext = std::move(message.ciphertext),
            .metadata = std::move(message.metadata),
            .content_hash = std::move(message.content_hash),
            .sources = std::move(message.sources),
            .created_at = models::Now(),
            .sequence = 0};

        auto insert = Statement::Prepare(db_.get(),
            "INSERT INTO messages (id, session_id, role, ciphertext, algorithm, key_id, iv, "
            "metadata_created_at, content_hash, auxiliary, created_at) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)");
        if (insert.IsErr()) {
            return R::Err(insert.UnwrapErr());
        }
        auto& row = insert.Unwrap();
        row.BindText(1, record.id)
            .BindText(2, record.session_id)
            .BindText(3, models::RoleTag(record.role))
            .BindBlob(4, record.ciphertext)
            .BindText(5, models::AlgorithmTag(record.metadata.algorithm))
            .BindText(6, record.metadata.key_id)
            .BindText(7, record.metadata.iv)
            .BindText(8, record.metadata.created_at)
            .BindText(9, record.content_hash)
            .BindInt64(11, models::ToUnixMicros(record.created_at));
        if (record.sources.empty()) {
            row.BindNull(10);
        } else {
            auto auxiliary = EncodeAuxiliary(record.sources);
            if (auxiliary.IsErr()) {
                return R::Err(auxiliary.UnwrapErr());
            }
            row.BindBlob(10, auxiliary.Unwrap());
        }
        if (auto run = row.Run(); run.IsErr()) {
            return R::Err(run.UnwrapErr());
        }
        record.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db_.get()));

        if (detail::ShouldAdoptTitle(record.role, has_user_message, current_title,
                                     options_.default_title, title_candidate)) {
            auto retitle = Statement::Prepare(db_.get(), "UPDATE sessions SET title = ?1 WHERE id = ?2");
            if (retitle.IsErr()) {
                return R::Err(retitle.UnwrapErr());
            }
            retitle.Unwrap().BindText(1, *title_candidate).BindText(2, session_id);
            if (auto run = retitle.Unwrap().Run(); run.IsErr()) {
                return R::Err(run.UnwrapErr());
            }
        }
        if (auto touched = Touch(session_id); touched.IsErr()) {
            return R::Err(touched.UnwrapErr());
        }
        return R::Ok(std::move(record));
    });
}

Result<std::vector<MessageRecord>, VaultFailure> SqliteSessionStore::ListMessages(
    std::string_view session_id, std::string_view owner_id) {
    using R = Result<std::vector<MessageRecord>, VaultFailure>;
    return InTransaction<std::vector<MessageRecord>>([&]() -> R {
        auto owned = IsOwned(session_id, owner_id);
        if (owned.IsErr()) {
            return R::Err(owned.UnwrapErr());
        }
        if (!owned.Unwrap()) {
            return R::Err(VaultFailure::AccessDenied());
        }
        auto stmt = Statement::Prepare(db_.get(),
            "SELECT id, session_id, role, ciphertext, algorithm, key_id, iv, metadata_created_at, "
            "content_hash, auxiliary, created_at, seq "
            "FROM messages WHERE session_id = ?1 ORDER BY seq ASC");
        if (stmt.IsErr()) {
            return R::Err(stmt.UnwrapErr());
        }
        auto& query = stmt.Unwrap();
        query.BindText(1, session_id);
        std::vector<MessageRecord> messages;
        while (true) {
            auto row = query.Step();
            if (row.IsErr()) {
                return R::Err(row.UnwrapErr());
            }
            if (!row.Unwrap()) {
                break;
            }
            auto role = models::ParseRole(query.ColumnText(2));
            if (role.IsErr()) {
                return R::Err(VaultFailure::Storage(role.UnwrapErr().message));
            }
            auto metadata = ReadMetadata(query, 4);
            if (metadata.IsErr()) {
                return R::Err(metadata.UnwrapErr());
            }
            std::vector<std::string> sources;
            if (!query.ColumnIsNull(9)) {
                auto decoded = DecodeAuxiliary(query.ColumnBlob(9));
                if (decoded.IsErr()) {
                    return R::Err(decoded.UnwrapErr());
                }
                sources = std::move(decoded).Unwrap();
            }
            messages.push_back(MessageRecord{
                .id = query.ColumnText(0),
                .session_id = query.ColumnText(1),
                .role = role.Unwrap(),
                .ciphertext = query.ColumnBlob(3),
                .metadata = std::move(metadata).Unwrap(),
                .content_hash = query.ColumnText(8),
                .sources = std::move(sources),
                .created_at = models::FromUnixMicros(query.ColumnInt64(10)),
                .sequence = static_cast<uint64_t>(query.ColumnInt64(11))});
        }
        return R::Ok(std::move(messages));
    });
}

Result<bool, VaultFailure> SqliteSessionStore::UpdateSessionData(
    std::string_view session_id, std::string_view owner_id, EncryptedBlob session_data) {
    if (auto valid = detail::ValidateBlob(session_data); valid.IsErr()) {
        return Result<bool, VaultFailure>::Err(valid.UnwrapErr());
    }
    return InTransaction<bool>([&]() -> Result<bool, VaultFailure> {
        const std::string sql = compat::format(
            "UPDATE sessions SET session_data = ?1, session_data_algorithm = ?2, session_data_key_id = ?3, "
            "session_data_iv = ?4, session_data_created_at = ?5, updated_at = ?6, touch_seq = {} "
            "WHERE id = ?7 AND owner_id = ?8", NEXT_TOUCH_SQL);
        auto stmt = Statement::Prepare(db_.get(), sql);
        if (stmt.IsErr()) {
            return Result<bool, VaultFailure>::Err(stmt.UnwrapErr());
        }
        stmt.Unwrap()
            .BindBlob(1, session_data.ciphertext)
            .BindText(2, models::AlgorithmTag(session_data.metadata.algorithm))
            .BindText(3, session_data.metadata.key_id)
            .BindText(4, session_data.metadata.iv)
            .BindText(5, session_data.metadata.created_at)
            .BindInt64(6, models::ToUnixMicros(models::Now()))
            .BindText(7, session_id)
            .BindText(8, owner_id);
        if (auto run = stmt.Unwrap().Run(); run.IsErr()) {
            return Result<bool, VaultFailure>::Err(run.UnwrapErr());
        }
        return Result<bool, VaultFailure>::Ok(sqlite3_changes(db_.get()) > 0);
    });
}

Result<std::optional<EncryptedBlob>, VaultFailure> SqliteSessionStore::GetSessionData(
    std::string_view session_id, std::string_view owner_id) {
    using R = Result<std::optional<EncryptedBlob>, VaultFailure>;
    return InTransaction<std::optional<EncryptedBlob>>([&]() -> R {
        auto stmt = Statement::Prepare(db_.get(),
            "SELECT session_data, session_data_algorithm, session_data_key_id, session_data_iv, "
            "session_data_created_at FROM sessions WHERE id = ?1 AND owner_id = ?2");
        if (stmt.IsErr()) {
            return R::Err(stmt.UnwrapErr());
        }
        auto& query = stmt.Unwrap();
        query.BindText(1, session_id).BindText(2, owner_id);
        auto row = query.Step();
        if (row.IsErr()) {
            return R::Err(row.UnwrapErr());
        }
        if (!row.Unwrap()) {
            return R::Err(VaultFailure::AccessDenied());
        }
        if (query.ColumnIsNull(0)) {
            return R::Ok(std::nullopt);
        }
        auto metadata = ReadMetadata(query, 1);
        if (metadata.IsErr()) {
            return R::Err(metadata.UnwrapErr());
        }
        return R::Ok(EncryptedBlob{.ciphertext = query.ColumnBlob(0), .metadata = std::move(metadata).Unwrap()});
    });
}

Result<size_t, VaultFailure> SqliteSessionStore::CountMessages(
    std::string_view session_id, std::string_view owner_id) {
    using R = Result<size_t, VaultFailure>;
    return InTransaction<size_t>([&]() -> R {
        auto owned = IsOwned(session_id, owner_id);
        if (owned.IsErr()) {
            return R::Err(owned.UnwrapErr());
        }
        if (!owned.Unwrap()) {
            return R::Err(VaultFailure::AccessDenied());
        }
        auto stmt = Statement::Prepare(db_.get(), "SELECT COUNT(*) FROM messages WHERE session_id = ?1");
        if (stmt.IsErr()) {
            return R::Err(stmt.UnwrapErr());
        }
        auto& query = stmt.Unwrap();
        query.BindText(1, session_id);
        auto row = query.Step();
        if (row.IsErr()) {
            return R::Err(row.UnwrapErr());
        }
        return R::Ok(row.Unwrap() ? static_cast<size_t>(query.ColumnInt64(0)) : 0);
    });
}

} // namespace chatvault::storage
