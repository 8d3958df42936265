#include "chatvault/models/timestamp.hpp"
#include "chatvault/core/format.hpp"

#include <ctime>

namespace chatvault::models {

Timestamp Now() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
}

std::string FormatIso8601(const Timestamp timestamp) {
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(timestamp);
    auto micros = (timestamp - seconds).count();
    auto whole = Clock::to_time_t(seconds);
    if (micros < 0) {
        micros += 1'000'000;
        whole -= 1;
    }
    std::tm utc{};
    gmtime_r(&whole, &utc);
    return compat::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z",
                          utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                          utc.tm_hour, utc.tm_min, utc.tm_sec, micros);
}

int64_t ToUnixMicros(const Timestamp timestamp) noexcept {
    return timestamp.time_since_epoch().count();
}

Timestamp FromUnixMicros(const int64_t micros) noexcept {
    return Timestamp(std::chrono::microseconds(micros));
}

} // namespace chatvault::models
