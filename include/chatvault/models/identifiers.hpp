#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"

#include <string>
#include <string_view>

namespace chatvault::models {

/** Random (version 4) UUID in canonical lowercase text form. */
[[nodiscard]] std::string GenerateUuid();

[[nodiscard]] bool IsValidUuid(std::string_view text) noexcept;

/** Validation failure unless @p text is 8-4-4-4-12 hex; returns it lowercased. */
[[nodiscard]] Result<std::string, VaultFailure> NormalizeUuid(std::string_view text);

/** Validation failure for an empty or oversized owner id. */
[[nodiscard]] Result<Unit, VaultFailure> ValidateOwnerId(std::string_view owner_id);

} // namespace chatvault::models
