#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace chatvault::models {

using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::microseconds>;

/** Current time at the microsecond precision the stores keep. */
[[nodiscard]] Timestamp Now();

/** YYYY-MM-DDTHH:MM:SS.ffffffZ (UTC). */
[[nodiscard]] std::string FormatIso8601(Timestamp timestamp);

[[nodiscard]] int64_t ToUnixMicros(Timestamp timestamp) noexcept;

[[nodiscard]] Timestamp FromUnixMicros(int64_t micros) noexcept;

} // namespace chatvault::models
