#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chatvault::crypto {

/**
 * @brief Transport encodings for binary fields (libsodium codecs)
 *
 * Base64 is the standard alphabet with padding. Decoders reject trailing or
 * embedded garbage with a Validation failure.
 */
class Encoding {
public:
    [[nodiscard]] static std::string ToBase64(std::span<const uint8_t> data);

    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure> FromBase64(std::string_view encoded);

    /** Lowercase hex. */
    [[nodiscard]] static std::string ToHex(std::span<const uint8_t> data);

    /** Accepts either case. */
    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure> FromHex(std::string_view encoded);

    [[nodiscard]] static std::span<const uint8_t> AsBytes(std::string_view text) noexcept {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

private:
    Encoding() = delete;
};

} // namespace chatvault::crypto
