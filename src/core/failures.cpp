#include "chatvault/core/failures.hpp"

namespace chatvault {

std::string_view ToString(const VaultFailureType type) noexcept {
    switch (type) {
        case VaultFailureType::Generic: return "Generic";
        case VaultFailureType::InvalidInput: return "InvalidInput";
        case VaultFailureType::Validation: return "ValidationError";
        case VaultFailureType::AccessDenied: return "AccessDenied";
        case VaultFailureType::Integrity: return "IntegrityError";
        case VaultFailureType::Decryption: return "DecryptionError";
        case VaultFailureType::Encryption: return "EncryptionError";
        case VaultFailureType::DeriveKey: return "DeriveKey";
        case VaultFailureType::Storage: return "StorageError";
        case VaultFailureType::UpstreamUnavailable: return "UpstreamUnavailable";
        case VaultFailureType::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

}
