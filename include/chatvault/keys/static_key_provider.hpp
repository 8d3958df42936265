#pragma once

#include "chatvault/interfaces/i_key_provider.hpp"
#include "chatvault/crypto/secure_memory_handle.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace chatvault::keys {

using crypto::SecureMemoryHandle;
using interfaces::IKeyProvider;

/**
 * @brief Fixed key table with a fallback key for unknown ids
 *
 * Every registered key_id maps to its agreed key; any other key_id resolves
 * to the fallback key and is logged at warn. This is a stand-in for a real
 * key-management integration, not one.
 */
class StaticKeyProvider final : public IKeyProvider {
public:
    static Result<std::unique_ptr<StaticKeyProvider>, VaultFailure> Create(
        std::span<const uint8_t> fallback_key);

    /**
     * @brief Reference configuration of the chat client
     *
     * "flutter_app_key" and every unknown id resolve to the 32-byte
     * placeholder key.
     */
    static Result<std::unique_ptr<StaticKeyProvider>, VaultFailure> Placeholder();

    Result<Unit, VaultFailure> Register(std::string key_id, std::span<const uint8_t> key);

    [[nodiscard]] Result<Unit, VaultFailure> ExecuteWithKey(
        std::string_view key_id,
        std::function<Result<Unit, VaultFailure>(std::span<const uint8_t>)> operation) override;

    [[nodiscard]] bool HasKey(std::string_view key_id) const;

    [[nodiscard]] size_t KeyCount() const;

private:
    explicit StaticKeyProvider(SecureMemoryHandle fallback_key) noexcept
        : fallback_key_(std::move(fallback_key)) {}

    static Result<SecureMemoryHandle, VaultFailure> Protect(std::span<const uint8_t> key);

    mutable std::mutex mutex_;
    std::map<std::string, SecureMemoryHandle, std::less<>> keys_;
    SecureMemoryHandle fallback_key_;
};

} // namespace chatvault::keys
