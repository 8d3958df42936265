#include "chatvault/crypto/encoding.hpp"
#include "chatvault/core/constants.hpp"

#include <sodium.h>

namespace chatvault::crypto {

std::string Encoding::ToBase64(std::span<const uint8_t> data) {
    const size_t encoded_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string encoded(encoded_len, '\0');
    sodium_bin2base64(encoded.data(), encoded_len, data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    encoded.resize(encoded_len - 1);
    return encoded;
}

Result<std::vector<uint8_t>, VaultFailure> Encoding::FromBase64(std::string_view encoded) {
    std::vector<uint8_t> decoded(encoded.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          encoded.data(), encoded.size(),
                          nullptr, &decoded_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != SodiumConstants::SUCCESS ||
        end != encoded.data() + encoded.size()) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::Validation("Malformed base64 input"));
    }
    decoded.resize(decoded_len);
    return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(decoded));
}

std::string Encoding::ToHex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.resize(data.size() * 2);
    return hex;
}

Result<std::vector<uint8_t>, VaultFailure> Encoding::FromHex(std::string_view encoded) {
    if (encoded.size() % 2 != 0) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::Validation("Hex input has odd length"));
    }
    std::vector<uint8_t> decoded(encoded.size() / 2);
    size_t decoded_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(decoded.data(), decoded.size(),
                       encoded.data(), encoded.size(),
                       nullptr, &decoded_len, &end) != SodiumConstants::SUCCESS ||
        end != encoded.data() + encoded.size()) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::Validation("Malformed hex input"));
    }
    decoded.resize(decoded_len);
    return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(decoded));
}

} // namespace chatvault::crypto
