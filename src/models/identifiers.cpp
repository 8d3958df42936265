#include "chatvault/models/identifiers.hpp"
#include "chatvault/crypto/encoding.hpp"
#include "chatvault/crypto/sodium_interop.hpp"
#include "chatvault/core/constants.hpp"

#include <array>

namespace chatvault::models {

namespace {

constexpr std::array<size_t, 4> HYPHEN_POSITIONS = {8, 13, 18, 23};

bool IsHyphenPosition(const size_t index) noexcept {
    for (const size_t position : HYPHEN_POSITIONS) {
        if (position == index) {
            return true;
        }
    }
    return false;
}

bool IsHexDigit(const char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

} // namespace

std::string GenerateUuid() {
    auto bytes = crypto::SodiumInterop::GetRandomBytes(Constants::UUID_BYTES);
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    const std::string hex = crypto::Encoding::ToHex(bytes);
    std::string uuid;
    uuid.reserve(Constants::UUID_TEXT_SIZE);
    uuid.append(hex, 0, 8).push_back('-');
    uuid.append(hex, 8, 4).push_back('-');
    uuid.append(hex, 12, 4).push_back('-');
    uuid.append(hex, 16, 4).push_back('-');
    uuid.append(hex, 20, 12);
    return uuid;
}

bool IsValidUuid(std::string_view text) noexcept {
    if (text.size() != Constants::UUID_TEXT_SIZE) {
        return false;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (IsHyphenPosition(i)) {
            if (text[i] != '-') {
                return false;
            }
        } else if (!IsHexDigit(text[i])) {
            return false;
        }
    }
    return true;
}

Result<std::string, VaultFailure> NormalizeUuid(std::string_view text) {
    if (!IsValidUuid(text)) {
        return Result<std::string, VaultFailure>::Err(
            VaultFailure::Validation("Session id is not a valid UUID"));
    }
    std::string normalized(text);
    for (char& c : normalized) {
        if (c >= 'A' && c <= 'F') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return Result<std::string, VaultFailure>::Ok(std::move(normalized));
}

Result<Unit, VaultFailure> ValidateOwnerId(std::string_view owner_id) {
    if (owner_id.empty()) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::Validation("Owner id must not be empty"));
    }
    if (owner_id.size() > Constants::MAX_OWNER_ID_SIZE) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::Validation("Owner id is too long"));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

} // namespace chatvault::models
