#include "chatvault/crypto/aes_gcm.hpp"
#include "chatvault/crypto/sodium_interop.hpp"
#include "chatvault/core/constants.hpp"
#include "chatvault/core/format.hpp"

#include <openssl/evp.h>
#include <openssl/err.h>

#include <memory>
#include <string>

namespace chatvault::crypto {

using OpenSSL = OpenSSLConstants;

namespace {

struct CipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

enum class Direction { Seal, Open };

std::string LastOpenSSLError() {
    const unsigned long err = ERR_get_error();
    if (err == OpenSSL::NO_ERROR) {
        return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
    }
    char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return buffer;
}

VaultFailure CipherFailure(const Direction direction, std::string_view what) {
    auto message = compat::format("{}: {}", what, LastOpenSSLError());
    return direction == Direction::Seal ? VaultFailure::Encryption(std::move(message))
                                        : VaultFailure::Decryption(std::move(message));
}

void Wipe(std::vector<uint8_t>& buffer) {
    auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
    (void)wipe;
}

// Validates sizes, then keys a fresh AES-256-GCM context for one message
Result<CipherContext, VaultFailure> KeyedContext(
    const Direction direction,
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce) {
    using R = Result<CipherContext, VaultFailure>;
    if (key.size() != Constants::AES_KEY_SIZE) {
        return R::Err(VaultFailure::InvalidInput(compat::format(
            "AES-256-GCM key must be {} bytes, got {}", Constants::AES_KEY_SIZE, key.size())));
    }
    if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
        return R::Err(VaultFailure::InvalidInput(compat::format(
            "AES-GCM nonce must be {} bytes, got {}", Constants::AES_GCM_NONCE_SIZE, nonce.size())));
    }

    CipherContext ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return R::Err(CipherFailure(direction, "Failed to create cipher context"));
    }
    const int encrypt = direction == Direction::Seal ? 1 : 0;
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, encrypt) != OpenSSL::SUCCESS ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) !=
            OpenSSL::SUCCESS ||
        EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), encrypt) != OpenSSL::SUCCESS) {
        return R::Err(CipherFailure(direction, "Failed to initialize AES-256-GCM"));
    }
    return R::Ok(std::move(ctx));
}

} // namespace

Result<std::vector<uint8_t>, VaultFailure> AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext) {
    using R = Result<std::vector<uint8_t>, VaultFailure>;
    auto keyed = KeyedContext(Direction::Seal, key, nonce);
    if (keyed.IsErr()) {
        return R::Err(std::move(keyed).UnwrapErr());
    }
    auto ctx = std::move(keyed).Unwrap();

    std::vector<uint8_t> sealed(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    int body_len = 0;
    int final_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), sealed.data(), &body_len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS ||
        EVP_EncryptFinal_ex(ctx.get(), sealed.data() + body_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(sealed);
        return R::Err(CipherFailure(Direction::Seal, "Encryption failed"));
    }
    const size_t body_size = static_cast<size_t>(body_len + final_len);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                            sealed.data() + body_size) != OpenSSL::SUCCESS) {
        Wipe(sealed);
        return R::Err(CipherFailure(Direction::Seal, "Failed to read authentication tag"));
    }
    sealed.resize(body_size + Constants::AES_GCM_TAG_SIZE);
    return R::Ok(std::move(sealed));
}

Result<std::vector<uint8_t>, VaultFailure> AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag) {
    using R = Result<std::vector<uint8_t>, VaultFailure>;
    if (ciphertext_with_tag.size() < Constants::AES_GCM_TAG_SIZE) {
        return R::Err(VaultFailure::Decryption(compat::format(
            "Ciphertext of {} bytes cannot hold a {}-byte tag",
            ciphertext_with_tag.size(), Constants::AES_GCM_TAG_SIZE)));
    }
    auto keyed = KeyedContext(Direction::Open, key, nonce);
    if (keyed.IsErr()) {
        return R::Err(std::move(keyed).UnwrapErr());
    }
    auto ctx = std::move(keyed).Unwrap();

    const size_t body_size = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
    const auto body = ciphertext_with_tag.first(body_size);
    // OpenSSL takes the expected tag through a non-const pointer
    std::vector<uint8_t> tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(body_size),
                             ciphertext_with_tag.end());

    std::vector<uint8_t> plaintext(body_size);
    int plain_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &plain_len, body.data(),
                          static_cast<int>(body.size())) != OpenSSL::SUCCESS ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) !=
            OpenSSL::SUCCESS) {
        Wipe(plaintext);
        return R::Err(CipherFailure(Direction::Open, "Decryption failed"));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plain_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(plaintext);
        ERR_clear_error();
        return R::Err(VaultFailure::Decryption(std::string(ErrorMessages::AES_GCM_DECRYPTION_FAILED)));
    }
    plaintext.resize(static_cast<size_t>(plain_len + final_len));
    return R::Ok(std::move(plaintext));
}

} // namespace chatvault::crypto
