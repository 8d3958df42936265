#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_template_test_macros.hpp>
#include "helpers/vault_fixture.hpp"
#include "helpers/store_fixtures.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace chatvault;
using namespace chatvault::test_helpers;
using chatvault::models::MessageRole;

namespace {

constexpr const char* kOwner = "user-1";

}

TEMPLATE_TEST_CASE("Concurrency - Parallel turns on one session", "[concurrency][pipeline]",
                   InMemoryStoreFactory, SqliteStoreFactory) {
    VaultFixture vault(TestType::Make(), configuration::VaultConfig::Default());
    const auto session_id = vault.store->CreateSession(kOwner, std::nullopt).Unwrap();

    constexpr int THREAD_COUNT = 8;
    constexpr int TURNS_PER_THREAD = 10;

    std::vector<models::ChatTurnRequest> requests;
    for (int t = 0; t < THREAD_COUNT; ++t) {
        for (int i = 0; i < TURNS_PER_THREAD; ++i) {
            requests.push_back(vault.Turn("t" + std::to_string(t) + "-m" + std::to_string(i), session_id));
        }
    }

    std::atomic<int> succeeded{0};
    std::atomic<int> failed{0};
    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < TURNS_PER_THREAD; ++i) {
                auto result = vault.pipeline->ProcessTurn(kOwner, requests[t * TURNS_PER_THREAD + i]);
                if (result.IsOk() && result.Unwrap().session_id == session_id) {
                    succeeded.fetch_add(1);
                } else {
                    failed.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failed.load() == 0);
    REQUIRE(succeeded.load() == THREAD_COUNT * TURNS_PER_THREAD);

    auto history = vault.pipeline->GetHistory(kOwner, session_id).Unwrap();
    REQUIRE(history.size() == static_cast<size_t>(2 * THREAD_COUNT * TURNS_PER_THREAD));

    std::set<std::string> user_texts;
    size_t bot_count = 0;
    for (size_t i = 0; i < history.size(); ++i) {
        if (i > 0) {
            REQUIRE(history[i - 1].sequence < history[i].sequence);
        }
        const auto text = vault.Open(history[i]);
        if (history[i].role == MessageRole::User) {
            user_texts.insert(text);
        } else {
            REQUIRE(text.rfind("echo: t", 0) == 0);
            ++bot_count;
        }
    }
    REQUIRE(user_texts.size() == static_cast<size_t>(THREAD_COUNT * TURNS_PER_THREAD));
    REQUIRE(bot_count == static_cast<size_t>(THREAD_COUNT * TURNS_PER_THREAD));
}

TEMPLATE_TEST_CASE("Concurrency - Parallel first turns open separate sessions", "[concurrency][pipeline]",
                   InMemoryStoreFactory, SqliteStoreFactory) {
    VaultFixture vault(TestType::Make(), configuration::VaultConfig::Default());

    constexpr int THREAD_COUNT = 16;
    std::mutex ids_mutex;
    std::set<std::string> session_ids;
    std::atomic<int> failed{0};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        auto request = vault.Turn("question " + std::to_string(t));
        threads.emplace_back([&, request = std::move(request)]() {
            auto result = vault.pipeline->ProcessTurn(kOwner, request);
            if (result.IsErr()) {
                failed.fetch_add(1);
                return;
            }
            std::lock_guard<std::mutex> lock(ids_mutex);
            session_ids.insert(result.Unwrap().session_id);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failed.load() == 0);
    REQUIRE(session_ids.size() == static_cast<size_t>(THREAD_COUNT));

    auto sessions = vault.store->ListSessions(kOwner, 100, 0).Unwrap();
    REQUIRE(sessions.size() == static_cast<size_t>(THREAD_COUNT));
    for (const auto& session : sessions) {
        REQUIRE(session.message_count == 2);
        REQUIRE(session.title.rfind("question ", 0) == 0);
    }
}

TEMPLATE_TEST_CASE("Concurrency - Racing first messages adopt exactly one title", "[concurrency][title]",
                   InMemoryStoreFactory, SqliteStoreFactory) {
    auto store = TestType::Make();
    const auto session_id = store->CreateSession(kOwner, std::nullopt).Unwrap();

    constexpr int THREAD_COUNT = 12;
    std::atomic<int> failed{0};
    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&, t]() {
            auto appended = store->AppendMessage(
                session_id, kOwner,
                MakeMessage(MessageRole::User, static_cast<uint8_t>(t)),
                "title " + std::to_string(t));
            if (appended.IsErr()) {
                failed.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failed.load() == 0);
    auto messages = store->ListMessages(session_id, kOwner).Unwrap();
    REQUIRE(messages.size() == static_cast<size_t>(THREAD_COUNT));

    // The winner is whichever append committed first
    const auto first_fill = static_cast<int>(messages.front().ciphertext.front());
    auto session = store->GetSession(session_id, kOwner).Unwrap();
    REQUIRE(session.has_value());
    REQUIRE(session->title == "title " + std::to_string(first_fill));
}
