#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"
#include "chatvault/core/constants.hpp"

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace chatvault::configuration {

/// Runtime configuration of a vault instance
///
/// Plain value class. Defaults reproduce the reference behaviour of the chat
/// service; every knob can be overridden through a `With*` copy or from the
/// process environment.
///
/// @example
/// ```cpp
/// auto config = VaultConfig::FromEnvironment();
/// if (config.IsErr()) { ... }
/// auto tuned = config.Unwrap().WithGenerationTimeout(std::chrono::seconds(5));
/// ```
class VaultConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    [[nodiscard]] static VaultConfig Default();

    /// Default() overlaid with the CHATVAULT_* environment variables
    ///
    /// Recognised variables:
    /// - CHATVAULT_DATABASE_PATH (empty keeps the in-memory store)
    /// - CHATVAULT_LOG_LEVEL (spdlog level name)
    /// - CHATVAULT_GENERATION_TIMEOUT_MS
    /// - CHATVAULT_MAX_TOKENS
    /// - CHATVAULT_TITLE_MAX_LENGTH
    /// - CHATVAULT_FALLBACK_REPLY
    ///
    /// A malformed value fails with Validation; the result is also Validate()d.
    [[nodiscard]] static Result<VaultConfig, VaultFailure> FromEnvironment();

    /// Reject values the pipeline cannot work with
    [[nodiscard]] Result<Unit, VaultFailure> Validate() const;

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] const std::string& GetDefaultTitle() const noexcept { return default_title_; }
    [[nodiscard]] size_t GetTitleMaxLength() const noexcept { return title_max_length_; }
    [[nodiscard]] const std::string& GetTitleTruncationMarker() const noexcept { return title_marker_; }
    [[nodiscard]] const std::string& GetFallbackReply() const noexcept { return fallback_reply_; }
    [[nodiscard]] std::chrono::milliseconds GetGenerationTimeout() const noexcept { return generation_timeout_; }
    [[nodiscard]] uint32_t GetMaxTokens() const noexcept { return max_tokens_; }
    [[nodiscard]] uint32_t GetDefaultPageSize() const noexcept { return default_page_size_; }
    [[nodiscard]] uint32_t GetMaxPageSize() const noexcept { return max_page_size_; }
    [[nodiscard]] const std::string& GetDatabasePath() const noexcept { return database_path_; }
    [[nodiscard]] spdlog::level::level_enum GetLogLevel() const noexcept { return log_level_; }
    [[nodiscard]] bool VerifyStoredHashes() const noexcept { return verify_stored_hashes_; }

    /// True when sessions live in memory only
    [[nodiscard]] bool IsInMemory() const noexcept { return database_path_.empty(); }

    // =========================================================================
    // Modifiers (return a modified copy)
    // =========================================================================

    [[nodiscard]] VaultConfig WithDefaultTitle(std::string title) const;
    [[nodiscard]] VaultConfig WithTitleMaxLength(size_t length) const;
    [[nodiscard]] VaultConfig WithFallbackReply(std::string reply) const;
    [[nodiscard]] VaultConfig WithGenerationTimeout(std::chrono::milliseconds timeout) const;
    [[nodiscard]] VaultConfig WithMaxTokens(uint32_t max_tokens) const;
    [[nodiscard]] VaultConfig WithPageSizes(uint32_t default_page_size, uint32_t max_page_size) const;
    [[nodiscard]] VaultConfig WithDatabasePath(std::string path) const;
    [[nodiscard]] VaultConfig WithLogLevel(spdlog::level::level_enum level) const;
    [[nodiscard]] VaultConfig WithStoredHashVerification(bool enabled) const;

private:
    VaultConfig() = default;

    std::string default_title_{VaultConstants::DEFAULT_SESSION_TITLE};
    size_t title_max_length_ = VaultConstants::DEFAULT_TITLE_MAX_LENGTH;
    std::string title_marker_{VaultConstants::TITLE_TRUNCATION_MARKER};
    std::string fallback_reply_{VaultConstants::DEFAULT_FALLBACK_REPLY};
    std::chrono::milliseconds generation_timeout_ = VaultConstants::DEFAULT_GENERATION_TIMEOUT;
    uint32_t max_tokens_ = VaultConstants::DEFAULT_MAX_TOKENS;
    uint32_t default_page_size_ = VaultConstants::DEFAULT_PAGE_SIZE;
    uint32_t max_page_size_ = VaultConstants::MAX_PAGE_SIZE;
    std::string database_path_;
    spdlog::level::level_enum log_level_ = spdlog::level::info;
    bool verify_stored_hashes_ = true;
};

} // namespace chatvault::configuration
