#include "chatvault/keys/derived_key_provider.hpp"
#include "chatvault/crypto/hkdf.hpp"
#include "chatvault/crypto/encoding.hpp"
#include "chatvault/crypto/sodium_interop.hpp"
#include "chatvault/core/constants.hpp"
#include "chatvault/core/format.hpp"

#include <array>
#include <string>

namespace chatvault::keys {

using crypto::Hkdf;
using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;

Result<std::unique_ptr<DerivedKeyProvider>, VaultFailure> DerivedKeyProvider::Create(
    std::span<const uint8_t> master_key) {
    if (master_key.size() != Constants::AES_KEY_SIZE) {
        return Result<std::unique_ptr<DerivedKeyProvider>, VaultFailure>::Err(VaultFailure::InvalidInput(
            compat::format("Master key must be {} bytes, got {}", Constants::AES_KEY_SIZE, master_key.size())));
    }
    auto handle = SecureMemoryHandle::FromBytes(master_key);
    if (handle.IsErr()) {
        return Result<std::unique_ptr<DerivedKeyProvider>, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return Result<std::unique_ptr<DerivedKeyProvider>, VaultFailure>::Ok(
        std::unique_ptr<DerivedKeyProvider>(new DerivedKeyProvider(std::move(handle).Unwrap())));
}

Result<Unit, VaultFailure> DerivedKeyProvider::ExecuteWithKey(
    std::string_view key_id,
    std::function<Result<Unit, VaultFailure>(std::span<const uint8_t>)> operation) {
    if (key_id.empty()) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::DeriveKey("Key id must not be empty"));
    }

    std::string info(VaultConstants::MESSAGE_KEY_INFO_PREFIX);
    info.append(key_id);

    std::array<uint8_t, Constants::AES_KEY_SIZE> message_key{};
    auto derived = master_.WithReadAccess([&](std::span<const uint8_t> master) {
        return Hkdf::DeriveKey(master, message_key, {}, crypto::Encoding::AsBytes(info));
    });
    if (derived.IsErr()) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::FromSodiumFailure(derived.UnwrapErr()));
    }
    if (derived.Unwrap().IsErr()) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(message_key));
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::DeriveKey(derived.Unwrap().UnwrapErr().message));
    }

    auto result = operation(message_key);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(message_key));
    return result;
}

} // namespace chatvault::keys
