#pragma once

#include "chatvault/interfaces/i_key_provider.hpp"
#include "chatvault/crypto/secure_memory_handle.hpp"

#include <memory>
#include <string_view>

namespace chatvault::keys {

/**
 * @brief Per key_id keys derived from one master secret
 *
 * key = HKDF-SHA256(master, salt = empty, info = "chatvault-message-key-v1:" || key_id)
 *
 * The derived key exists only for the duration of the lent operation and is
 * wiped afterwards. Unknown ids are not special-cased: each id has its own key.
 */
class DerivedKeyProvider final : public interfaces::IKeyProvider {
public:
    static Result<std::unique_ptr<DerivedKeyProvider>, VaultFailure> Create(
        std::span<const uint8_t> master_key);

    [[nodiscard]] Result<Unit, VaultFailure> ExecuteWithKey(
        std::string_view key_id,
        std::function<Result<Unit, VaultFailure>(std::span<const uint8_t>)> operation) override;

private:
    explicit DerivedKeyProvider(crypto::SecureMemoryHandle master) noexcept
        : master_(std::move(master)) {}

    crypto::SecureMemoryHandle master_;
};

} // namespace chatvault::keys
