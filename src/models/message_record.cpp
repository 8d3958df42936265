#include "chatvault/models/message_record.hpp"
#include "chatvault/core/constants.hpp"
#include "chatvault/core/format.hpp"

namespace chatvault::models {

std::string_view RoleTag(const MessageRole role) noexcept {
    switch (role) {
        case MessageRole::User:
            return VaultConstants::ROLE_USER;
        case MessageRole::Bot:
            return VaultConstants::ROLE_BOT;
    }
    return "unknown";
}

Result<MessageRole, VaultFailure> ParseRole(std::string_view tag) {
    if (tag == VaultConstants::ROLE_USER) {
        return Result<MessageRole, VaultFailure>::Ok(MessageRole::User);
    }
    if (tag == VaultConstants::ROLE_BOT) {
        return Result<MessageRole, VaultFailure>::Ok(MessageRole::Bot);
    }
    return Result<MessageRole, VaultFailure>::Err(
        VaultFailure::Validation(compat::format("Unknown message role '{}'", tag)));
}

} // namespace chatvault::models
