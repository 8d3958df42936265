#include "chatvault/keys/static_key_provider.hpp"
#include "chatvault/crypto/encoding.hpp"
#include "chatvault/core/constants.hpp"
#include "chatvault/core/format.hpp"
#include "chatvault/logging/logger.hpp"

namespace chatvault::keys {

Result<SecureMemoryHandle, VaultFailure> StaticKeyProvider::Protect(std::span<const uint8_t> key) {
    if (key.size() != Constants::AES_KEY_SIZE) {
        return Result<SecureMemoryHandle, VaultFailure>::Err(VaultFailure::InvalidInput(
            compat::format("Key must be {} bytes, got {}", Constants::AES_KEY_SIZE, key.size())));
    }
    return SecureMemoryHandle::FromBytes(key).MapErr(&VaultFailure::FromSodiumFailure);
}

Result<std::unique_ptr<StaticKeyProvider>, VaultFailure> StaticKeyProvider::Create(
    std::span<const uint8_t> fallback_key) {
    auto protected_key = Protect(fallback_key);
    if (protected_key.IsErr()) {
        return Result<std::unique_ptr<StaticKeyProvider>, VaultFailure>::Err(protected_key.UnwrapErr());
    }
    return Result<std::unique_ptr<StaticKeyProvider>, VaultFailure>::Ok(
        std::unique_ptr<StaticKeyProvider>(new StaticKeyProvider(std::move(protected_key).Unwrap())));
}

Result<std::unique_ptr<StaticKeyProvider>, VaultFailure> StaticKeyProvider::Placeholder() {
    const auto key = crypto::Encoding::AsBytes(VaultConstants::PLACEHOLDER_KEY);
    auto provider = Create(key);
    if (provider.IsErr()) {
        return provider;
    }
    auto registered = provider.Unwrap()->Register(
        std::string(VaultConstants::WELL_KNOWN_CLIENT_KEY_ID), key);
    if (registered.IsErr()) {
        return Result<std::unique_ptr<StaticKeyProvider>, VaultFailure>::Err(registered.UnwrapErr());
    }
    return provider;
}

Result<Unit, VaultFailure> StaticKeyProvider::Register(std::string key_id, std::span<const uint8_t> key) {
    if (key_id.empty()) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::InvalidInput("Key id must not be empty"));
    }
    auto protected_key = Protect(key);
    if (protected_key.IsErr()) {
        return Result<Unit, VaultFailure>::Err(protected_key.UnwrapErr());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    keys_.insert_or_assign(std::move(key_id), std::move(protected_key).Unwrap());
    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<Unit, VaultFailure> StaticKeyProvider::ExecuteWithKey(
    std::string_view key_id,
    std::function<Result<Unit, VaultFailure>(std::span<const uint8_t>)> operation) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SecureMemoryHandle* handle = &fallback_key_;
    if (const auto it = keys_.find(key_id); it != keys_.end()) {
        handle = &it->second;
    } else {
        logging::GetLogger()->warn("Unknown key id '{}', using placeholder key", key_id);
    }

    auto outcome = handle->WithReadAccess(
        [&operation](std::span<const uint8_t> key) { return operation(key); });
    if (outcome.IsErr()) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::FromSodiumFailure(outcome.UnwrapErr()));
    }
    return std::move(outcome).Unwrap();
}

bool StaticKeyProvider::HasKey(std::string_view key_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.find(key_id) != keys_.end();
}

size_t StaticKeyProvider::KeyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.size();
}

} // namespace chatvault::keys
