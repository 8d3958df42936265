#include <catch2/catch_test_macros.hpp>
#include "helpers/vault_fixture.hpp"
#include "helpers/store_fixtures.hpp"
#include "chatvault/models/identifiers.hpp"

#include <sqlite3.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

using namespace chatvault;
using namespace chatvault::test_helpers;
using chatvault::storage::SqliteSessionStore;

namespace {

constexpr const char* kOwner = "user-1";

// Database file in the temp directory, removed with its WAL side files
class TempDatabase {
public:
    TempDatabase()
        : path_(std::filesystem::temp_directory_path() /
                ("chatvault_test_" + models::GenerateUuid() + ".db")) {}

    ~TempDatabase() {
        std::error_code ignored;
        for (const char* suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(path_.string() + suffix, ignored);
        }
    }

    TempDatabase(const TempDatabase&) = delete;
    TempDatabase& operator=(const TempDatabase&) = delete;

    [[nodiscard]] std::string Path() const { return path_.string(); }

    [[nodiscard]] std::shared_ptr<SqliteSessionStore> Open(storage::StoreOptions options = {}) const {
        auto opened = SqliteSessionStore::Open(Path(), std::move(options));
        REQUIRE(opened.IsOk());
        return std::move(opened).Unwrap();
    }

private:
    std::filesystem::path path_;
};

}

TEST_CASE("SQLite persistence - Sessions survive reopening", "[integration][sqlite]") {
    TempDatabase database;
    std::string session_id;
    std::string first_reply_hash;

    {
        VaultFixture vault(database.Open(), configuration::VaultConfig::Default());
        vault.backend->ReplyWith(200, "Bergen and Oslo.", {"guide.pdf#p3"});
        auto first = vault.pipeline->ProcessTurn(kOwner, vault.Turn("Cities in Norway?"));
        REQUIRE(first.IsOk());
        session_id = first.Unwrap().session_id;
        first_reply_hash = first.Unwrap().content_hash;
    }
    REQUIRE(std::filesystem::exists(database.Path()));

    VaultFixture reopened(database.Open(), configuration::VaultConfig::Default());

    SECTION("Session row and title") {
        auto session = reopened.store->GetSession(session_id, kOwner).Unwrap();
        REQUIRE(session.has_value());
        REQUIRE(session->title == "Cities in Norway?");
        REQUIRE(session->owner_id == kOwner);
        REQUIRE(session->created_at <= session->updated_at);
    }
    SECTION("Messages decrypt with their stored metadata") {
        auto history = reopened.pipeline->GetHistory(kOwner, session_id).Unwrap();
        REQUIRE(history.size() == 2);
        REQUIRE(reopened.Open(history[0]) == "Cities in Norway?");
        REQUIRE(reopened.Open(history[1]) == "Bergen and Oslo.");
        REQUIRE(history[1].content_hash == first_reply_hash);
        REQUIRE(history[1].sources == std::vector<std::string>{"guide.pdf#p3"});
        REQUIRE(history[0].sequence < history[1].sequence);
    }
    SECTION("Conversation continues with the stored context") {
        auto second = reopened.pipeline->ProcessTurn(kOwner, reopened.Turn("Which is larger?", session_id));
        REQUIRE(second.IsOk());
        auto request = reopened.backend->LastRequest();
        REQUIRE(request.has_value());
        REQUIRE(request->history.size() == 2);
        REQUIRE(request->history[1].content == "Bergen and Oslo.");

        auto history = reopened.pipeline->GetHistory(kOwner, session_id).Unwrap();
        REQUIRE(history.size() == 4);
        REQUIRE(history[1].sequence < history[2].sequence);
        // Title was settled by the first user message before the reopen
        REQUIRE(reopened.store->GetSession(session_id, kOwner).Unwrap()->title == "Cities in Norway?");
    }
    SECTION("Ownership still applies") {
        auto history = reopened.pipeline->GetHistory("someone-else", session_id);
        REQUIRE(history.IsErr());
        REQUIRE(history.UnwrapErr().Is(VaultFailureType::AccessDenied));
    }
}

TEST_CASE("SQLite persistence - Session data and deletion", "[integration][sqlite]") {
    TempDatabase database;
    std::string session_id;
    const auto blob_metadata = MakeMessage(models::MessageRole::User, 0).metadata;

    {
        auto store = database.Open();
        session_id = store->CreateSession(kOwner, std::string("Notes")).Unwrap();
        REQUIRE(store->AppendMessage(session_id, kOwner, MakeMessage(models::MessageRole::User, 0x41), std::nullopt).IsOk());
        REQUIRE(store->UpdateSessionData(session_id, kOwner,
                                         models::EncryptedBlob{.ciphertext = {9, 8, 7, 6}, .metadata = blob_metadata})
                    .Unwrap());
    }

    auto store = database.Open();
    auto data = store->GetSessionData(session_id, kOwner).Unwrap();
    REQUIRE(data.has_value());
    REQUIRE(data->ciphertext == std::vector<uint8_t>{9, 8, 7, 6});
    REQUIRE(data->metadata == blob_metadata);

    REQUIRE(store->DeleteSession(session_id, kOwner).Unwrap());
    store.reset();

    auto after_delete = database.Open();
    REQUIRE_FALSE(after_delete->GetSession(session_id, kOwner).Unwrap().has_value());
    REQUIRE(after_delete->ListSessions(kOwner, 10, 0).Unwrap().empty());
    REQUIRE(after_delete->CountMessages(session_id, kOwner).UnwrapErr().Is(VaultFailureType::AccessDenied));
}

TEST_CASE("SQLite persistence - Unopenable path", "[integration][sqlite]") {
    const auto missing_dir = std::filesystem::temp_directory_path() / ("chatvault_missing_" + models::GenerateUuid());
    auto opened = SqliteSessionStore::Open((missing_dir / "vault.db").string());
    REQUIRE(opened.IsErr());
    REQUIRE(opened.UnwrapErr().Is(VaultFailureType::Storage));
}

TEST_CASE("SQLite persistence - Busy timeout", "[integration][sqlite]") {
    TempDatabase database;
    REQUIRE(storage::StoreOptions{}.busy_timeout == VaultConstants::SQLITE_BUSY_TIMEOUT);

    storage::StoreOptions options;
    options.busy_timeout = std::chrono::milliseconds(50);
    auto store = database.Open(options);
    auto session_id = store->CreateSession(kOwner, std::nullopt).Unwrap();

    sqlite3* writer = nullptr;
    REQUIRE(sqlite3_open(database.Path().c_str(), &writer) == SQLITE_OK);
    REQUIRE(sqlite3_exec(writer, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) == SQLITE_OK);

    SECTION("Writer holding the lock past the timeout fails the call as storage") {
        const auto started = std::chrono::steady_clock::now();
        auto renamed = store->UpdateTitle(session_id, kOwner, "Blocked");
        REQUIRE(renamed.IsErr());
        REQUIRE(renamed.UnwrapErr().Is(VaultFailureType::Storage));
        REQUIRE(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(40));
    }
    SECTION("Released lock lets the next call through") {
        REQUIRE(sqlite3_exec(writer, "COMMIT;", nullptr, nullptr, nullptr) == SQLITE_OK);
        REQUIRE(store->UpdateTitle(session_id, kOwner, "Free").Unwrap());
        REQUIRE(store->GetSession(session_id, kOwner).Unwrap()->title == "Free");
    }

    sqlite3_exec(writer, "ROLLBACK;", nullptr, nullptr, nullptr);
    REQUIRE(sqlite3_close(writer) == SQLITE_OK);
}

TEST_CASE("SQLite persistence - Oversized busy timeout still opens", "[integration][sqlite]") {
    TempDatabase database;
    storage::StoreOptions options;
    options.busy_timeout = std::chrono::hours(24 * 365);
    auto store = database.Open(options);
    auto session_id = store->CreateSession(kOwner, std::string("Long wait")).Unwrap();
    REQUIRE(store->GetSession(session_id, kOwner).Unwrap()->title == "Long wait");
}
