#include "chatvault/logging/logger.hpp"
#include "chatvault/configuration/vault_config.hpp"
#include "chatvault/core/constants.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace chatvault::logging {

namespace {
std::mutex logger_mutex;
}

std::shared_ptr<spdlog::logger> GetLogger() {
    const std::string name(VaultConstants::LOGGER_NAME);
    std::lock_guard<std::mutex> lock(logger_mutex);
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(name);
    }
    return logger;
}

void SetLevel(const spdlog::level::level_enum level) {
    GetLogger()->set_level(level);
}

void Configure(const configuration::VaultConfig& config) {
    SetLevel(config.GetLogLevel());
}

bool ParseLevel(std::string_view name, spdlog::level::level_enum& level) {
    const auto parsed = spdlog::level::from_str(std::string(name));
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }
    level = parsed;
    return true;
}

} // namespace chatvault::logging
