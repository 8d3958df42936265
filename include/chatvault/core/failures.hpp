#pragma once
#include <string>
#include <string_view>
namespace chatvault {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    AllocationFailed,
    InvalidOperation
};
enum class VaultFailureType {
    Generic,
    InvalidInput,
    Validation,
    AccessDenied,
    Integrity,
    Decryption,
    Encryption,
    DeriveKey,
    Storage,
    UpstreamUnavailable,
    Cancelled
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class VaultFailure {
public:
    VaultFailureType type;
    std::string message;
    VaultFailure(const VaultFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static VaultFailure Generic(std::string msg) {
        return {VaultFailureType::Generic, std::move(msg)};
    }
    static VaultFailure InvalidInput(std::string msg) {
        return {VaultFailureType::InvalidInput, std::move(msg)};
    }
    static VaultFailure Validation(std::string msg) {
        return {VaultFailureType::Validation, std::move(msg)};
    }
    // Never says whether the session exists.
    static VaultFailure AccessDenied() {
        return {VaultFailureType::AccessDenied, "Session not found or access denied"};
    }
    static VaultFailure Integrity(std::string msg) {
        return {VaultFailureType::Integrity, std::move(msg)};
    }
    static VaultFailure Decryption(std::string msg) {
        return {VaultFailureType::Decryption, std::move(msg)};
    }
    static VaultFailure Encryption(std::string msg) {
        return {VaultFailureType::Encryption, std::move(msg)};
    }
    static VaultFailure DeriveKey(std::string msg) {
        return {VaultFailureType::DeriveKey, std::move(msg)};
    }
    static VaultFailure Storage(std::string msg) {
        return {VaultFailureType::Storage, std::move(msg)};
    }
    static VaultFailure UpstreamUnavailable(std::string msg) {
        return {VaultFailureType::UpstreamUnavailable, std::move(msg)};
    }
    static VaultFailure Cancelled(std::string msg) {
        return {VaultFailureType::Cancelled, std::move(msg)};
    }
    // Allocation and initialization problems surface as Generic.
    static VaultFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    [[nodiscard]] bool Is(const VaultFailureType t) const noexcept {
        return type == t;
    }
};
std::string_view ToString(VaultFailureType type) noexcept;
}
