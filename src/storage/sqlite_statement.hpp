#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"
#include "chatvault/storage/sqlite_session_store.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chatvault::storage::detail {

/**
 * @brief Prepared statement with 1-based binds and 0-based columns
 *
 * Bind errors are deferred to Step() so call sites stay linear.
 */
class Statement {
public:
    static Result<Statement, VaultFailure> Prepare(sqlite3* db, std::string_view sql);

    Statement& BindText(int index, std::string_view value);
    Statement& BindBlob(int index, std::span<const uint8_t> value);
    Statement& BindInt64(int index, int64_t value);
    Statement& BindNull(int index);

    /** Ok(true) when a row is available, Ok(false) when done. */
    Result<bool, VaultFailure> Step();

    /** Step until done, for statements that return no rows. */
    Result<Unit, VaultFailure> Run();

    [[nodiscard]] std::string ColumnText(int column) const;
    [[nodiscard]] std::vector<uint8_t> ColumnBlob(int column) const;
    [[nodiscard]] int64_t ColumnInt64(int column) const;
    [[nodiscard]] bool ColumnIsNull(int column) const;

private:
    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const {
            if (stmt) {
                sqlite3_finalize(stmt);
            }
        }
    };

    Statement(sqlite3* db, sqlite3_stmt* stmt) noexcept : db_(db), stmt_(stmt) {}

    void Track(int rc);

    sqlite3* db_;
    std::unique_ptr<sqlite3_stmt, StatementDeleter> stmt_;
    int bind_error_ = SQLITE_OK;
};

[[nodiscard]] VaultFailure StorageError(sqlite3* db, std::string_view context);

} // namespace chatvault::storage::detail
