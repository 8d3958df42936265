#include "chatvault/storage/in_memory_session_store.hpp"
#include "chatvault/logging/logger.hpp"
#include "store_rules.hpp"

#include <algorithm>

namespace chatvault::storage {

using models::EncryptedBlob;
using models::MessageRecord;
using models::SessionRecord;
using models::SessionSummary;

InMemorySessionStore::InMemorySessionStore(StoreOptions options)
    : options_(std::move(options)) {}

InMemorySessionStore::SessionEntry* InMemorySessionStore::FindOwned(
    std::string_view session_id, std::string_view owner_id) {
    const auto it = sessions_.find(std::string(session_id));
    if (it == sessions_.end() || it->second.record.owner_id != owner_id) {
        return nullptr;
    }
    return &it->second;
}

void InMemorySessionStore::Touch(SessionEntry& entry) {
    entry.record.updated_at = models::Now();
    entry.touch_sequence = next_touch_sequence_++;
}

Result<std::string, VaultFailure> InMemorySessionStore::CreateSession(
    std::string_view owner_id, std::optional<std::string> title) {
    if (auto valid = models::ValidateOwnerId(owner_id); valid.IsErr()) {
        return Result<std::string, VaultFailure>::Err(valid.UnwrapErr());
    }

    const auto now = models::Now();
    SessionEntry entry;
    entry.record = SessionRecord{
        .id = models::GenerateUuid(),
        .owner_id = std::string(owner_id),
        .title = detail::ResolveTitle(std::move(title), options_.default_title),
        .session_data = std::nullopt,
        .created_at = now,
        .updated_at = now};

    std::string id = entry.record.id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.touch_sequence = next_touch_sequence_++;
        sessions_.emplace(id, std::move(entry));
    }
    logging::GetLogger()->info("Created session {}", id);
    return Result<std::string, VaultFailure>::Ok(std::move(id));
}

Result<std::optional<SessionRecord>, VaultFailure> InMemorySessionStore::GetSession(
    std::string_view session_id, std::string_view owner_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SessionEntry* entry = FindOwned(session_id, owner_id);
    if (entry == nullptr) {
        return Result<std::optional<SessionRecord>, VaultFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<SessionRecord>, VaultFailure>::Ok(entry->record);
}

Result<std::vector<SessionSummary>, VaultFailure> InMemorySessionStore::ListSessions(
    std::string_view owner_id, const uint32_t limit, const uint32_t offset) {
    if (auto valid = detail::ValidatePage(limit, options_.max_page_size); valid.IsErr()) {
        return Result<std::vector<SessionSummary>, VaultFailure>::Err(valid.UnwrapErr());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const SessionEntry*> owned;
    for (const auto& [id, entry] : sessions_) {
        if (entry.record.owner_id == owner_id) {
            owned.push_back(&entry);
        }
    }
    std::sort(owned.begin(), owned.end(), [](const SessionEntry* a, const SessionEntry* b) {
        if (a->record.updated_at != b->record.updated_at) {
            return a->record.updated_at > b->record.updated_at;
        }
        return a->touch_sequence > b->touch_sequence;
    });

    std::vector<SessionSummary> page;
    for (size_t i = offset; i < owned.size() && page.size() < limit; ++i) {
        const auto& record = owned[i]->record;
        page.push_back(SessionSummary{
            .id = record.id,
            .owner_id = record.owner_id,
            .title = record.title,
            .created_at = record.created_at,
            .updated_at = record.updated_at,
            .message_count = owned[i]->messages.size()});
    }
    return Result<std::vector<SessionSummary>, VaultFailure>::Ok(std::move(page));
}

Result<bool, VaultFailure> InMemorySessionStore::DeleteSession(
    std::string_view session_id, std::string_view owner_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (FindOwned(session_id, owner_id) == nullptr) {
            return Result<bool, VaultFailure>::Ok(false);
        }
        sessions_.erase(std::string(session_id));
    }
    logging::GetLogger()->info("Deleted session {}", session_id);
    return Result<bool, VaultFailure>::Ok(true);
}

Result<bool, VaultFailure> InMemorySessionStore::UpdateTitle(
    std::string_view session_id, std::string_view owner_id, std::string title) {
    if (title.empty()) {
        return Result<bool, VaultFailure>::Err(VaultFailure::Validation("Title must not be empty"));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    SessionEntry* entry = FindOwned(session_id, owner_id);
    if (entry == nullptr) {
        return Result<bool, VaultFailure>::Ok(false);
    }
    entry->record.title = std::move(title);
    Touch(*entry);
    return Result<bool, VaultFailure>::Ok(true);
}

Result<MessageRecord, VaultFailure> InMemorySessionStore::AppendMessage(
    std::string_view session_id,
    std::string_view owner_id,
    models::NewMessage message,
    std::optional<std::string> title_candidate) {
    if (auto valid = detail::ValidateNewMessage(message); valid.IsErr()) {
        return Result<MessageRecord, VaultFailure>::Err(valid.UnwrapErr());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    SessionEntry* entry = FindOwned(session_id, owner_id);
    if (entry == nullptr) {
        return Result<MessageRecord, VaultFailure>::Err(VaultFailure::AccessDenied());
    }

    MessageRecord record{
        .id = models::GenerateUuid(),
        .session_id = entry->record.id,
        .role = message.role,
        .ciphertext = std::move(message.ciphertext),
        .metadata = std::move(message.metadata),
        .content_hash = std::move(message.content_hash),
        .sources = std::move(message.sources),
        .created_at = models::Now(),
        .sequence = next_message_sequence_++};

    if (detail::ShouldAdoptTitle(record.role, entry->has_user_message, entry->record.title,
                                 options_.default_title, title_candidate)) {
        entry->record.title = std::move(*title_candidate);
    }
    if (record.role == models::MessageRole::User) {
        entry->has_user_message = true;
    }
    entry->messages.push_back(record);
    Touch(*entry);
    return Result<MessageRecord, VaultFailure>::Ok(std::move(record));
}

Result<std::vector<MessageRecord>, VaultFailure> InMemorySessionStore::ListMessages(
    std::string_view session_id, std::string_view owner_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SessionEntry* entry = FindOwned(session_id, owner_id);
    if (entry == nullptr) {
        return Result<std::vector<MessageRecord>, VaultFailure>::Err(VaultFailure::AccessDenied());
    }
    return Result<std::vector<MessageRecord>, VaultFailure>::Ok(entry->messages);
}

Result<bool, VaultFailure> InMemorySessionStore::UpdateSessionData(
    std::string_view session_id, std::string_view owner_id, EncryptedBlob session_data) {
    if (auto valid = detail::ValidateBlob(session_data); valid.IsErr()) {
        return Result<bool, VaultFailure>::Err(valid.UnwrapErr());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    SessionEntry* entry = FindOwned(session_id, owner_id);
    if (entry == nullptr) {
        return Result<bool, VaultFailure>::Ok(false);
    }
    entry->record.session_data = std::move(session_data);
    Touch(*entry);
    return Result<bool, VaultFailure>::Ok(true);
}

Result<std::optional<EncryptedBlob>, VaultFailure> InMemorySessionStore::GetSessionData(
    std::string_view session_id, std::string_view owner_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SessionEntry* entry = FindOwned(session_id, owner_id);
    if (entry == nullptr) {
        return Result<std::optional<EncryptedBlob>, VaultFailure>::Err(VaultFailure::AccessDenied());
    }
    return Result<std::optional<EncryptedBlob>, VaultFailure>::Ok(entry->record.session_data);
}

Result<size_t, VaultFailure> InMemorySessionStore::CountMessages(
    std::string_view session_id, std::string_view owner_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SessionEntry* entry = FindOwned(session_id, owner_id);
    if (entry == nullptr) {
        return Result<size_t, VaultFailure>::Err(VaultFailure::AccessDenied());
    }
    return Result<size_t, VaultFailure>::Ok(entry->messages.size());
}

} // namespace chatvault::storage
