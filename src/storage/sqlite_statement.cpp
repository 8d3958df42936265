#include "sqlite_statement.hpp"
#include "chatvault/core/format.hpp"

namespace chatvault::storage::detail {

void Sqlite3Deleter::operator()(sqlite3* db) const noexcept {
    if (db) {
        sqlite3_close_v2(db);
    }
}

VaultFailure StorageError(sqlite3* db, std::string_view context) {
    return VaultFailure::Storage(compat::format("{}: {}", context,
                                                db != nullptr ? sqlite3_errmsg(db) : "no database"));
}

Result<Statement, VaultFailure> Statement::Prepare(sqlite3* db, std::string_view sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr) != SQLITE_OK) {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
        return Result<Statement, VaultFailure>::Err(StorageError(db, "Failed to prepare statement"));
    }
    return Result<Statement, VaultFailure>::Ok(Statement(db, stmt));
}

void Statement::Track(const int rc) {
    if (rc != SQLITE_OK && bind_error_ == SQLITE_OK) {
        bind_error_ = rc;
    }
}

Statement& Statement::BindText(const int index, std::string_view value) {
    Track(sqlite3_bind_text(stmt_.get(), index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    return *this;
}

Statement& Statement::BindBlob(const int index, std::span<const uint8_t> value) {
    // zeroblob keeps empty ciphertexts distinct from NULL
    if (value.empty()) {
        Track(sqlite3_bind_zeroblob(stmt_.get(), index, 0));
    } else {
        Track(sqlite3_bind_blob(stmt_.get(), index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }
    return *this;
}

Statement& Statement::BindInt64(const int index, const int64_t value) {
    Track(sqlite3_bind_int64(stmt_.get(), index, value));
    return *this;
}

Statement& Statement::BindNull(const int index) {
    Track(sqlite3_bind_null(stmt_.get(), index));
    return *this;
}

Result<bool, VaultFailure> Statement::Step() {
    if (bind_error_ != SQLITE_OK) {
        return Result<bool, VaultFailure>::Err(VaultFailure::Storage(
            compat::format("Failed to bind parameter: {}", sqlite3_errstr(bind_error_))));
    }
    const int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, VaultFailure>::Ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, VaultFailure>::Ok(false);
    }
    return Result<bool, VaultFailure>::Err(StorageError(db_, "Statement failed"));
}

Result<Unit, VaultFailure> Statement::Run() {
    while (true) {
        auto step = Step();
        if (step.IsErr()) {
            return Result<Unit, VaultFailure>::Err(step.UnwrapErr());
        }
        if (!step.Unwrap()) {
            return Result<Unit, VaultFailure>::Ok(unit);
        }
    }
}

std::string Statement::ColumnText(const int column) const {
    const auto* text = sqlite3_column_text(stmt_.get(), column);
    if (text == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), column)));
}

std::vector<uint8_t> Statement::ColumnBlob(const int column) const {
    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_.get(), column));
    const int size = sqlite3_column_bytes(stmt_.get(), column);
    if (data == nullptr || size <= 0) {
        return {};
    }
    return std::vector<uint8_t>(data, data + size);
}

int64_t Statement::ColumnInt64(const int column) const {
    return sqlite3_column_int64(stmt_.get(), column);
}

bool Statement::ColumnIsNull(const int column) const {
    return sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL;
}

} // namespace chatvault::storage::detail
