#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <utility>

namespace chatvault::crypto {

/**
 * @brief Move-only owner of one sodium_malloc region holding key material
 *
 * The region is guard-paged, locked in RAM and zeroed when released. Key
 * providers keep one handle per key and lend its bytes through
 * WithReadAccess, so a key never lands in ordinary heap memory.
 */
class SecureMemoryHandle {
public:
    /** Zero-filled region of @p size bytes; @p size must be non-zero. */
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /** Region sized to @p data holding a copy of it. */
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    SecureMemoryHandle() noexcept = default;
    ~SecureMemoryHandle();

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
        : bytes_(std::exchange(other.bytes_, nullptr))
        , size_(std::exchange(other.size_, 0)) {}

    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /// Overwrite from the start; a shorter @p data leaves the tail zeroed
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /// Copy the whole region into @p output, which must be at least Size() bytes
    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(ReleasedFailure());
        }
        return Result<T, SodiumFailure>::Ok(
            std::forward<F>(func)(std::span<const uint8_t>(bytes_, size_)));
    }

    [[nodiscard]] bool IsInvalid() const noexcept { return bytes_ == nullptr; }
    [[nodiscard]] size_t Size() const noexcept { return size_; }

private:
    SecureMemoryHandle(uint8_t* bytes, size_t size) noexcept : bytes_(bytes), size_(size) {}

    static SodiumFailure ReleasedFailure();

    void Release() noexcept;

    uint8_t* bytes_ = nullptr;
    size_t size_ = 0;
};

} // namespace chatvault::crypto
