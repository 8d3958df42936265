#pragma once

#include "chatvault/configuration/vault_config.hpp"
#include "chatvault/core/constants.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace chatvault::storage {

struct StoreOptions {
    std::string default_title{VaultConstants::DEFAULT_SESSION_TITLE};
    uint32_t max_page_size = VaultConstants::MAX_PAGE_SIZE;
    /** How long a SQLite writer waits on a locked database before failing. */
    std::chrono::milliseconds busy_timeout = VaultConstants::SQLITE_BUSY_TIMEOUT;

    static StoreOptions FromConfig(const configuration::VaultConfig& config) {
        return StoreOptions{
            .default_title = config.GetDefaultTitle(),
            .max_page_size = config.GetMaxPageSize()};
    }
};

} // namespace chatvault::storage
