#include "chatvault/configuration/vault_config.hpp"
#include "chatvault/logging/logger.hpp"
#include "chatvault/core/format.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string_view>

namespace chatvault::configuration {

namespace {

std::optional<std::string> ReadEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

Result<uint64_t, VaultFailure> ParseUnsigned(const char* name, std::string_view text) {
    uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return Result<uint64_t, VaultFailure>::Err(VaultFailure::Validation(
            compat::format("{} is not a non-negative integer: '{}'", name, text)));
    }
    return Result<uint64_t, VaultFailure>::Ok(value);
}

} // namespace

VaultConfig VaultConfig::Default() {
    return VaultConfig();
}

Result<VaultConfig, VaultFailure> VaultConfig::FromEnvironment() {
    VaultConfig config;

    if (auto path = ReadEnv("CHATVAULT_DATABASE_PATH")) {
        config.database_path_ = std::move(*path);
    }
    if (auto level_name = ReadEnv("CHATVAULT_LOG_LEVEL")) {
        spdlog::level::level_enum level;
        if (!logging::ParseLevel(*level_name, level)) {
            return Result<VaultConfig, VaultFailure>::Err(VaultFailure::Validation(
                compat::format("CHATVAULT_LOG_LEVEL is not a log level: '{}'", *level_name)));
        }
        config.log_level_ = level;
    }
    if (auto timeout = ReadEnv("CHATVAULT_GENERATION_TIMEOUT_MS")) {
        auto parsed = ParseUnsigned("CHATVAULT_GENERATION_TIMEOUT_MS", *timeout);
        if (parsed.IsErr()) {
            return Result<VaultConfig, VaultFailure>::Err(parsed.UnwrapErr());
        }
        config.generation_timeout_ = std::chrono::milliseconds(parsed.Unwrap());
    }
    if (auto tokens = ReadEnv("CHATVAULT_MAX_TOKENS")) {
        auto parsed = ParseUnsigned("CHATVAULT_MAX_TOKENS", *tokens);
        if (parsed.IsErr()) {
            return Result<VaultConfig, VaultFailure>::Err(parsed.UnwrapErr());
        }
        if (parsed.Unwrap() > std::numeric_limits<uint32_t>::max()) {
            return Result<VaultConfig, VaultFailure>::Err(
                VaultFailure::Validation("CHATVAULT_MAX_TOKENS is out of range"));
        }
        config.max_tokens_ = static_cast<uint32_t>(parsed.Unwrap());
    }
    if (auto title_length = ReadEnv("CHATVAULT_TITLE_MAX_LENGTH")) {
        auto parsed = ParseUnsigned("CHATVAULT_TITLE_MAX_LENGTH", *title_length);
        if (parsed.IsErr()) {
            return Result<VaultConfig, VaultFailure>::Err(parsed.UnwrapErr());
        }
        config.title_max_length_ = static_cast<size_t>(parsed.Unwrap());
    }
    if (auto fallback = ReadEnv("CHATVAULT_FALLBACK_REPLY")) {
        config.fallback_reply_ = std::move(*fallback);
    }

    auto valid = config.Validate();
    if (valid.IsErr()) {
        return Result<VaultConfig, VaultFailure>::Err(valid.UnwrapErr());
    }
    return Result<VaultConfig, VaultFailure>::Ok(std::move(config));
}

Result<Unit, VaultFailure> VaultConfig::Validate() const {
    if (default_title_.empty()) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::Validation("Default title must not be empty"));
    }
    if (title_max_length_ == 0) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::Validation("Title max length must be positive"));
    }
    if (fallback_reply_.empty()) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::Validation("Fallback reply must not be empty"));
    }
    if (generation_timeout_.count() <= 0) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::Validation("Generation timeout must be positive"));
    }
    if (max_tokens_ == 0) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::Validation("Max tokens must be positive"));
    }
    if (default_page_size_ == 0 || max_page_size_ == 0 || default_page_size_ > max_page_size_) {
        return Result<Unit, VaultFailure>::Err(VaultFailure::Validation(
            compat::format("Invalid page sizes: default {} max {}", default_page_size_, max_page_size_)));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

VaultConfig VaultConfig::WithDefaultTitle(std::string title) const {
    VaultConfig copy = *this;
    copy.default_title_ = std::move(title);
    return copy;
}

VaultConfig VaultConfig::WithTitleMaxLength(const size_t length) const {
    VaultConfig copy = *this;
    copy.title_max_length_ = length;
    return copy;
}

VaultConfig VaultConfig::WithFallbackReply(std::string reply) const {
    VaultConfig copy = *this;
    copy.fallback_reply_ = std::move(reply);
    return copy;
}

VaultConfig VaultConfig::WithGenerationTimeout(const std::chrono::milliseconds timeout) const {
    VaultConfig copy = *this;
    copy.generation_timeout_ = timeout;
    return copy;
}

VaultConfig VaultConfig::WithMaxTokens(const uint32_t max_tokens) const {
    VaultConfig copy = *this;
    copy.max_tokens_ = max_tokens;
    return copy;
}

VaultConfig VaultConfig::WithPageSizes(const uint32_t default_page_size, const uint32_t max_page_size) const {
    VaultConfig copy = *this;
    copy.default_page_size_ = default_page_size;
    copy.max_page_size_ = max_page_size;
    return copy;
}

VaultConfig VaultConfig::WithDatabasePath(std::string path) const {
    VaultConfig copy = *this;
    copy.database_path_ = std::move(path);
    return copy;
}

VaultConfig VaultConfig::WithLogLevel(const spdlog::level::level_enum level) const {
    VaultConfig copy = *this;
    copy.log_level_ = level;
    return copy;
}

VaultConfig VaultConfig::WithStoredHashVerification(const bool enabled) const {
    VaultConfig copy = *this;
    copy.verify_stored_hashes_ = enabled;
    return copy;
}

} // namespace chatvault::configuration
