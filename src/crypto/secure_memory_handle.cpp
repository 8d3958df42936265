#include "chatvault/crypto/secure_memory_handle.hpp"
#include "chatvault/crypto/sodium_interop.hpp"
#include "chatvault/core/constants.hpp"
#include "chatvault/core/format.hpp"

#include <sodium.h>

#include <algorithm>
#include <string>

namespace chatvault::crypto {

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(const size_t size) {
    using R = Result<SecureMemoryHandle, SodiumFailure>;
    if (!SodiumInterop::IsInitialized()) {
        return R::Err(SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return R::Err(SodiumFailure::AllocationFailed("Secure region must not be empty"));
    }
    auto* bytes = static_cast<uint8_t*>(sodium_malloc(size));
    if (bytes == nullptr) {
        return R::Err(SodiumFailure::AllocationFailed(
            compat::format("{}{} bytes", ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, size)));
    }
    // sodium_malloc fills with 0xdb
    sodium_memzero(bytes, size);
    return R::Ok(SecureMemoryHandle(bytes, size));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::FromBytes(std::span<const uint8_t> data) {
    auto allocated = Allocate(data.size());
    if (allocated.IsErr()) {
        return allocated;
    }
    std::copy(data.begin(), data.end(), allocated.Unwrap().bytes_);
    return allocated;
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Release();
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        Release();
        bytes_ = std::exchange(other.bytes_, nullptr);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

void SecureMemoryHandle::Release() noexcept {
    if (bytes_ != nullptr) {
        // sodium_free zeroes before unmapping
        sodium_free(bytes_);
        bytes_ = nullptr;
        size_ = 0;
    }
}

SodiumFailure SecureMemoryHandle::ReleasedFailure() {
    return SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED));
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(ReleasedFailure());
    }
    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(SodiumFailure::BufferTooSmall(
            compat::format("{} ({} > {})", ErrorMessages::DATA_EXCEEDS_BUFFER, data.size(), size_)));
    }
    std::copy(data.begin(), data.end(), bytes_);
    sodium_memzero(bytes_ + data.size(), size_ - data.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Read(std::span<uint8_t> output) const {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(ReleasedFailure());
    }
    if (output.size() < size_) {
        return Result<Unit, SodiumFailure>::Err(SodiumFailure::BufferTooSmall(
            compat::format("Output holds {} bytes, region has {}", output.size(), size_)));
    }
    std::copy(bytes_, bytes_ + size_, output.begin());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

} // namespace chatvault::crypto
