#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace chatvault::configuration {
class VaultConfig;
}

namespace chatvault::logging {

/**
 * @brief Shared "chatvault" logger (stdout colour sink)
 *
 * Created on first use and registered with spdlog, so host applications can
 * reach it with spdlog::get("chatvault") as well. Never log plaintext, key
 * bytes or ciphertext through it.
 */
std::shared_ptr<spdlog::logger> GetLogger();

void SetLevel(spdlog::level::level_enum level);

void Configure(const configuration::VaultConfig& config);

/** Accepts spdlog level names ("trace" .. "off"). */
[[nodiscard]] bool ParseLevel(std::string_view name, spdlog::level::level_enum& level);

} // namespace chatvault::logging
