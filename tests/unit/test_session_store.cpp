#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_template_test_macros.hpp>
#include "helpers/store_fixtures.hpp"
#include "chatvault/models/identifiers.hpp"

#include <set>
#include <string>

using namespace chatvault;
using namespace chatvault::test_helpers;
using models::MessageRole;

namespace {
constexpr const char* kOwner = "user-a";
}

TEMPLATE_TEST_CASE("SessionStore - Create and get", "[store]", InMemoryStoreFactory, SqliteStoreFactory) {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto store = TestType::Make();

    SECTION("New session gets a UUID and the default title") {
        auto created = store->CreateSession(kOwner, std::nullopt);
        REQUIRE(created.IsOk());
        REQUIRE(models::IsValidUuid(created.Unwrap()));

        auto session = store->GetSession(created.Unwrap(), kOwner);
        REQUIRE(session.IsOk());
        REQUIRE(session.Unwrap().has_value());
        const auto& record = *session.Unwrap();
        REQUIRE(record.id == created.Unwrap());
        REQUIRE(record.owner_id == kOwner);
        REQUIRE(record.title == "New Chat Session");
        REQUIRE_FALSE(record.session_data.has_value());
        REQUIRE(record.created_at == record.updated_at);
    }
    SECTION("Explicit title is kept, empty title means default") {
        auto titled = store->CreateSession(kOwner, std::string("Trip planning")).Unwrap();
        auto untitled = store->CreateSession(kOwner, std::string()).Unwrap();
        REQUIRE(store->GetSession(titled, kOwner).Unwrap()->title == "Trip planning");
        REQUIRE(store->GetSession(untitled, kOwner).Unwrap()->title == "New Chat Session");
    }
    SECTION("Configured default title") {
        auto custom = TestType::Make(storage::StoreOptions{.default_title = "Untitled", .max_page_size = 100});
        auto id = custom->CreateSession(kOwner, std::nullopt).Unwrap();
        REQUIRE(custom->GetSession(id, kOwner).Unwrap()->title == "Untitled");
    }
    SECTION("Invalid owner id is rejected") {
        auto created = store->CreateSession("", std::nullopt);
        REQUIRE(created.IsErr());
        REQUIRE(created.UnwrapErr().Is(VaultFailureType::Validation));
    }
    SECTION("Unknown session reads as absent") {
        auto session = store->GetSession("3f2504e0-4f89-41d3-9a0c-0305e82c3301", kOwner);
        REQUIRE(session.IsOk());
        REQUIRE_FALSE(session.Unwrap().has_value());
    }
}

TEMPLATE_TEST_CASE("SessionStore - Messages", "[store]", InMemoryStoreFactory, SqliteStoreFactory) {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto store = TestType::Make();
    const auto id = store->CreateSession(kOwner, std::nullopt).Unwrap();

    SECTION("Messages come back in insertion order with their fields") {
        auto first = store->AppendMessage(id, kOwner, MakeMessage(MessageRole::User, 0x01), std::nullopt);
        auto second = store->AppendMessage(
            id, kOwner, MakeMessage(MessageRole::Bot, std::vector<uint8_t>(40, 0x02), {"doc-1", "doc-2"}),
            std::nullopt);
        auto third = store->AppendMessage(id, kOwner, MakeMessage(MessageRole::User, 0x03), std::nullopt);
        REQUIRE(first.IsOk());
        REQUIRE(second.IsOk());
        REQUIRE(third.IsOk());
        REQUIRE(first.Unwrap().sequence < second.Unwrap().sequence);
        REQUIRE(second.Unwrap().sequence < third.Unwrap().sequence);

        auto messages = store->ListMessages(id, kOwner);
        REQUIRE(messages.IsOk());
        const auto& list = messages.Unwrap();
        REQUIRE(list.size() == 3);
        REQUIRE(list[0].id == first.Unwrap().id);
        REQUIRE(list[1].id == second.Unwrap().id);
        REQUIRE(list[2].id == third.Unwrap().id);
        REQUIRE(list[0].role == MessageRole::User);
        REQUIRE(list[1].role == MessageRole::Bot);
        REQUIRE(list[1].ciphertext == std::vector<uint8_t>(40, 0x02));
        REQUIRE(list[1].sources == std::vector<std::string>{"doc-1", "doc-2"});
        REQUIRE(list[0].sources.empty());
        REQUIRE(list[1].metadata == MakeMessage(MessageRole::Bot, 0x02).metadata);
        REQUIRE(list[1].content_hash == crypto::ContentHash::Compute(list[1].ciphertext));
        REQUIRE(list[1].session_id == id);
        REQUIRE(list[1].created_at == second.Unwrap().created_at);
    }
    SECTION("Appending bumps updated_at") {
        const auto before = store->GetSession(id, kOwner).Unwrap()->updated_at;
        REQUIRE(store->AppendMessage(id, kOwner, MakeMessage(MessageRole::User, 0x01), std::nullopt).IsOk());
        REQUIRE(store->GetSession(id, kOwner).Unwrap()->updated_at >= before);
        REQUIRE(store->CountMessages(id, kOwner).Unwrap() == 1);
    }
    SECTION("Malformed content hash is rejected before anything is stored") {
        auto message = MakeMessage(MessageRole::User, 0x01);
        message.content_hash = "abc";
        auto appended = store->AppendMessage(id, kOwner, std::move(message), std::nullopt);
        REQUIRE(appended.IsErr());
        REQUIRE(appended.UnwrapErr().Is(VaultFailureType::Validation));
        REQUIRE(store->CountMessages(id, kOwner).Unwrap() == 0);
    }
    SECTION("Message without a nonce is rejected before anything is stored") {
        auto message = MakeMessage(MessageRole::User, 0x01);
        message.metadata.iv.clear();
        auto appended = store->AppendMessage(id, kOwner, std::move(message), std::nullopt);
        REQUIRE(appended.IsErr());
        REQUIRE(appended.UnwrapErr().Is(VaultFailureType::Validation));
        REQUIRE(store->ListMessages(id, kOwner).Unwrap().empty());
    }
    SECTION("Unknown session is access denied") {
        auto appended = store->AppendMessage(
            "3f2504e0-4f89-41d3-9a0c-0305e82c3301", kOwner, MakeMessage(MessageRole::User, 0x01), std::nullopt);
        REQUIRE(appended.IsErr());
        REQUIRE(appended.UnwrapErr().Is(VaultFailureType::AccessDenied));
    }
}

TEMPLATE_TEST_CASE("SessionStore - Auto title", "[store][title]", InMemoryStoreFactory, SqliteStoreFactory) {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto store = TestType::Make();

    SECTION("First user message names a default-titled session") {
        const auto id = store->CreateSession(kOwner, std::nullopt).Unwrap();
        REQUIRE(store->AppendMessage(id, kOwner, MakeMessage(MessageRole::User, 0x01),
                                     std::string("Weekend plans")).IsOk());
        REQUIRE(store->GetSession(id, kOwner).Unwrap()->title == "Weekend plans");
    }
    SECTION("Later user messages never rename it") {
        const auto id = store->CreateSession(kOwner, std::nullopt).Unwrap();
        REQUIRE(store->AppendMessage(id, kOwner, MakeMessage(MessageRole::User, 0x01),
                                     std::string("First")).IsOk());
        REQUIRE(store->AppendMessage(id, kOwner, MakeMessage(MessageRole::User, 0x02),
                                     std::string("Second")).IsOk());
        REQUIRE(store->GetSession(id, kOwner).Unwrap()->title == "First");
    }
    SECTION("Explicit titles are not replaced") {
        const auto id = store->CreateSession(kOwner, std::string("Chosen")).Unwrap();
        REQUIRE(store->AppendMessage(id, kOwner, MakeMessage(MessageRole::User, 0x01),
                                     std::string("Candidate")).IsOk());
        REQUIRE(store->GetSession(id, kOwner).Unwrap()->title == "Chosen");
    }
    SECTION("Bot messages never name a session") {
        const auto id = store->CreateSession(kOwner, std::nullopt).Unwrap();
        REQUIRE(store->AppendMessage(id, kOwner, MakeMessage(MessageRole::Bot, 0x01),
                                     std::string("From bot")).IsOk());
        REQUIRE(store->GetSession(id, kOwner).Unwrap()->title == "New Chat Session");
    }
    SECTION("First user message without a candidate keeps the default") {
        const auto id = store->CreateSession(kOwner, std::nullopt).Unwrap();
        REQUIRE(store->AppendMessage(id, kOwner, MakeMessage(MessageRole::User, 0x01), std::nullopt).IsOk());
        REQUIRE(store->AppendMessage(id, kOwner, MakeMessage(MessageRole::User, 0x02),
                                     std::string("Too late")).IsOk());
        REQUIRE(store->GetSession(id, kOwner).Unwrap()->title == "New Chat Session");
    }
    SECTION("Manual rename") {
        const auto id = store->CreateSession(kOwner, std::nullopt).Unwrap();
        REQUIRE(store->UpdateTitle(id, kOwner, "Renamed").Unwrap());
        REQUIRE(store->GetSession(id, kOwner).Unwrap()->title == "Renamed");
        auto empty = store->UpdateTitle(id, kOwner, "");
        REQUIRE(empty.IsErr());
        REQUIRE(empty.UnwrapErr().Is(VaultFailureType::Validation));
    }
}

TEMPLATE_TEST_CASE("SessionStore - Listing", "[store]", InMemoryStoreFactory, SqliteStoreFactory) {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto store = TestType::Make();

    SECTION("Most recently updated first, with message counts") {
        const auto older = store->CreateSession(kOwner, std::string("older")).Unwrap();
        const auto newer = store->CreateSession(kOwner, std::string("newer")).Unwrap();
        auto before = store->ListSessions(kOwner, 10, 0).Unwrap();
        REQUIRE(before.size() == 2);
        REQUIRE(before[0].id == newer);
        REQUIRE(before[1].id == older);

        REQUIRE(store->AppendMessage(older, kOwner, MakeMessage(MessageRole::User, 0x01), std::nullopt).IsOk());
        REQUIRE(store->AppendMessage(older, kOwner, MakeMessage(MessageRole::Bot, 0x02), std::nullopt).IsOk());
        auto after = store->ListSessions(kOwner, 10, 0).Unwrap();
        REQUIRE(after[0].id == older);
        REQUIRE(after[0].message_count == 2);
        REQUIRE(after[0].title == "older");
        REQUIRE(after[1].message_count == 0);
    }
    SECTION("Pages partition the listing") {
        std::set<std::string> created;
        for (int i = 0; i < 5; ++i) {
            created.insert(store->CreateSession(kOwner, std::nullopt).Unwrap());
        }
        std::set<std::string> seen;
        for (uint32_t offset = 0; offset < 6; offset += 2) {
            for (const auto& summary : store->ListSessions(kOwner, 2, offset).Unwrap()) {
                seen.insert(summary.id);
            }
        }
        REQUIRE(seen == created);
        REQUIRE(store->ListSessions(kOwner, 2, 4).Unwrap().size() == 1);
        REQUIRE(store->ListSessions(kOwner, 2, 10).Unwrap().empty());
    }
    SECTION("Page limit must be within bounds") {
        auto zero = store->ListSessions(kOwner, 0, 0);
        REQUIRE(zero.IsErr());
        REQUIRE(zero.UnwrapErr().Is(VaultFailureType::Validation));
        REQUIRE(store->ListSessions(kOwner, 101, 0).IsErr());
        REQUIRE(store->ListSessions(kOwner, 100, 0).IsOk());
    }
    SECTION("Owner with no sessions gets an empty page") {
        REQUIRE(store->ListSessions("nobody", 10, 0).Unwrap().empty());
    }
}

TEMPLATE_TEST_CASE("SessionStore - Delete", "[store]", InMemoryStoreFactory, SqliteStoreFactory) {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto store = TestType::Make();
    const auto id = store->CreateSession(kOwner, std::nullopt).Unwrap();
    REQUIRE(store->AppendMessage(id, kOwner, MakeMessage(MessageRole::User, 0x01), std::nullopt).IsOk());
    REQUIRE(store->AppendMessage(id, kOwner, MakeMessage(MessageRole::Bot, 0x02), std::nullopt).IsOk());

    SECTION("Deleting removes the session and its messages") {
        REQUIRE(store->DeleteSession(id, kOwner).Unwrap());
        REQUIRE_FALSE(store->GetSession(id, kOwner).Unwrap().has_value());
        REQUIRE(store->ListMessages(id, kOwner).UnwrapErr().Is(VaultFailureType::AccessDenied));
        REQUIRE(store->CountMessages(id, kOwner).UnwrapErr().Is(VaultFailureType::AccessDenied));
        REQUIRE(store->ListSessions(kOwner, 10, 0).Unwrap().empty());
    }
    SECTION("Deleting twice reports not found") {
        REQUIRE(store->DeleteSession(id, kOwner).Unwrap());
        REQUIRE_FALSE(store->DeleteSession(id, kOwner).Unwrap());
    }
    SECTION("Other sessions are untouched") {
        const auto other = store->CreateSession(kOwner, std::nullopt).Unwrap();
        REQUIRE(store->AppendMessage(other, kOwner, MakeMessage(MessageRole::User, 0x03), std::nullopt).IsOk());
        REQUIRE(store->DeleteSession(id, kOwner).Unwrap());
        REQUIRE(store->CountMessages(other, kOwner).Unwrap() == 1);
    }
}

TEMPLATE_TEST_CASE("SessionStore - Session data", "[store]", InMemoryStoreFactory, SqliteStoreFactory) {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto store = TestType::Make();
    const auto id = store->CreateSession(kOwner, std::nullopt).Unwrap();

    SECTION("Absent until written") {
        auto data = store->GetSessionData(id, kOwner);
        REQUIRE(data.IsOk());
        REQUIRE_FALSE(data.Unwrap().has_value());
    }
    SECTION("Stored blob comes back unchanged") {
        const auto message = MakeMessage(MessageRole::User, 0x09);
        models::EncryptedBlob blob{.ciphertext = message.ciphertext, .metadata = message.metadata};
        REQUIRE(store->UpdateSessionData(id, kOwner, blob).Unwrap());

        auto data = store->GetSessionData(id, kOwner).Unwrap();
        REQUIRE(data.has_value());
        REQUIRE(data->ciphertext == blob.ciphertext);
        REQUIRE(data->metadata == blob.metadata);
        REQUIRE(store->GetSession(id, kOwner).Unwrap()->session_data.has_value());
    }
    SECTION("Blob that could not be loaded back is rejected and nothing changes") {
        const auto message = MakeMessage(MessageRole::User, 0x09);
        const models::EncryptedBlob valid{.ciphertext = message.ciphertext, .metadata = message.metadata};

        auto no_key_id = valid;
        no_key_id.metadata.key_id.clear();
        auto no_iv = valid;
        no_iv.metadata.iv.clear();
        auto unknown_algorithm = valid;
        unknown_algorithm.metadata.algorithm = static_cast<models::EncryptionAlgorithm>(7);
        auto no_ciphertext = valid;
        no_ciphertext.ciphertext.clear();

        for (const auto& blob : {no_key_id, no_iv, unknown_algorithm, no_ciphertext}) {
            auto written = store->UpdateSessionData(id, kOwner, blob);
            REQUIRE(written.IsErr());
            REQUIRE(written.UnwrapErr().Is(VaultFailureType::Validation));
        }

        auto session = store->GetSession(id, kOwner);
        REQUIRE(session.IsOk());
        REQUIRE(session.Unwrap().has_value());
        REQUIRE_FALSE(session.Unwrap()->session_data.has_value());
        auto data = store->GetSessionData(id, kOwner);
        REQUIRE(data.IsOk());
        REQUIRE_FALSE(data.Unwrap().has_value());
    }
    SECTION("Unknown session") {
        const auto message = MakeMessage(MessageRole::User, 0x09);
        models::EncryptedBlob blob{.ciphertext = message.ciphertext, .metadata = message.metadata};
        REQUIRE_FALSE(store->UpdateSessionData("3f2504e0-4f89-41d3-9a0c-0305e82c3301", kOwner, blob).Unwrap());
        REQUIRE(store->GetSessionData("3f2504e0-4f89-41d3-9a0c-0305e82c3301", kOwner)
                    .UnwrapErr().Is(VaultFailureType::AccessDenied));
    }
}
