#include "chatvault/crypto/hkdf.hpp"
#include "chatvault/core/constants.hpp"
#include "chatvault/core/format.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>
#include <string>

namespace chatvault::crypto {

namespace {
    struct EVP_KDF_Deleter {
        void operator()(EVP_KDF* kdf) const { EVP_KDF_free(kdf); }
    };
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const { EVP_KDF_CTX_free(ctx); }
    };
}

Result<Unit, VaultFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::InvalidInput(
                compat::format("HKDF output size must be in [1, {}], got {}",
                    MAX_OUTPUT_LEN, output.size())));
    }

    if (ikm.empty()) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::InvalidInput("HKDF input key material cannot be empty"));
    }

    std::unique_ptr<EVP_KDF, EVP_KDF_Deleter> kdf(
        EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_HKDF.data(), nullptr));
    if (!kdf) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::DeriveKey("Failed to fetch HKDF algorithm"));
    }

    std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter> kctx(EVP_KDF_CTX_new(kdf.get()));
    if (!kctx) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::DeriveKey("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;

    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OpenSSLConstants::PARAM_DIGEST.data(),
        const_cast<char*>(OpenSSLConstants::ALGORITHM_SHA256.data()), 0);

    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OpenSSLConstants::PARAM_KEY.data(), const_cast<uint8_t*>(ikm.data()), ikm.size());

    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OpenSSLConstants::PARAM_SALT.data(), const_cast<uint8_t*>(salt.data()), salt.size());
    }

    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OpenSSLConstants::PARAM_INFO.data(), const_cast<uint8_t*>(info.data()), info.size());
    }

    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSLConstants::SUCCESS) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::DeriveKey("HKDF key derivation failed"));
    }

    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, VaultFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);

    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            std::move(result).UnwrapErr());
    }

    return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(output));
}

} // namespace chatvault::crypto
