#include "chatvault/crypto/content_hash.hpp"
#include "chatvault/crypto/encoding.hpp"
#include "chatvault/crypto/sodium_interop.hpp"
#include "chatvault/core/constants.hpp"

namespace chatvault::crypto {

std::string ContentHash::Compute(std::span<const uint8_t> ciphertext) {
    const auto digest = SodiumInterop::Sha256(ciphertext);
    return Encoding::ToHex(digest);
}

bool ContentHash::Verify(std::span<const uint8_t> ciphertext, std::string_view claimed_hash) {
    if (claimed_hash.size() != Constants::SHA_256_HEX_SIZE) {
        return false;
    }
    auto claimed = Encoding::FromHex(claimed_hash);
    if (claimed.IsErr()) {
        return false;
    }
    const auto digest = SodiumInterop::Sha256(ciphertext);
    auto equal = SodiumInterop::ConstantTimeEquals(digest, claimed.Unwrap());
    return equal.IsOk() && equal.Unwrap();
}

Result<Unit, VaultFailure> ContentHash::Require(std::span<const uint8_t> ciphertext,
                                                std::string_view claimed_hash) {
    if (!Verify(ciphertext, claimed_hash)) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::Integrity(std::string(ErrorMessages::CONTENT_HASH_MISMATCH)));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

} // namespace chatvault::crypto
