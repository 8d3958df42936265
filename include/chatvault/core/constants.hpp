#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace chatvault {
struct Constants {
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t SHA_256_DIGEST_SIZE = 32;
    static constexpr size_t SHA_256_HEX_SIZE = SHA_256_DIGEST_SIZE * 2;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr size_t UUID_BYTES = 16;
    static constexpr size_t UUID_TEXT_SIZE = 36;
    static constexpr size_t MAX_OWNER_ID_SIZE = 128;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_HKDF = "HKDF";
    static constexpr std::string_view ALGORITHM_SHA256 = "SHA256";
    static constexpr std::string_view PARAM_DIGEST = "digest";
    static constexpr std::string_view PARAM_KEY = "key";
    static constexpr std::string_view PARAM_SALT = "salt";
    static constexpr std::string_view PARAM_INFO = "info";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};
struct VaultConstants {
    static constexpr std::string_view ALGORITHM_AES_256_GCM = "AES-256-GCM";
    static constexpr std::string_view ROLE_USER = "user";
    static constexpr std::string_view ROLE_BOT = "bot";
    static constexpr std::string_view DEFAULT_SESSION_TITLE = "New Chat Session";
    static constexpr std::string_view TITLE_TRUNCATION_MARKER = "...";
    static constexpr size_t DEFAULT_TITLE_MAX_LENGTH = 50;
    static constexpr std::string_view DEFAULT_FALLBACK_REPLY =
        "I'm sorry, I'm having trouble generating a response right now. Please try again in a moment.";
    static constexpr std::chrono::milliseconds DEFAULT_GENERATION_TIMEOUT{30'000};
    static constexpr std::chrono::milliseconds SQLITE_BUSY_TIMEOUT{5'000};
    static constexpr uint32_t DEFAULT_MAX_TOKENS = 512;
    static constexpr uint32_t DEFAULT_PAGE_SIZE = 50;
    static constexpr uint32_t MAX_PAGE_SIZE = 100;
    static constexpr int HTTP_STATUS_OK_MIN = 200;
    static constexpr int HTTP_STATUS_OK_MAX = 299;
    static constexpr std::string_view MESSAGE_KEY_INFO_PREFIX = "chatvault-message-key-v1:";
    static constexpr std::string_view WELL_KNOWN_CLIENT_KEY_ID = "flutter_app_key";
    static constexpr std::string_view PLACEHOLDER_KEY = "placeholder_key_32_bytes_long_fo";
    static constexpr std::string_view LOGGER_NAME = "chatvault";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view AES_GCM_DECRYPTION_FAILED = "AES-GCM decryption failed (authentication tag mismatch)";
    static constexpr std::string_view MISSING_NONCE = "Encryption metadata has no nonce";
    static constexpr std::string_view CONTENT_HASH_MISMATCH = "Content hash does not match ciphertext";
};
}
