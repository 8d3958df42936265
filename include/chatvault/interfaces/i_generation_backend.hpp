#pragma once
#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"
#include "chatvault/models/message_record.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
namespace chatvault::interfaces {

struct GenerationTurn {
    models::MessageRole role = models::MessageRole::User;
    std::string content;
};

/** Plaintext; lives only for the duration of one Generate call. */
struct GenerationRequest {
    std::string query;
    std::vector<GenerationTurn> history;
    uint32_t max_tokens = 0;
    std::chrono::milliseconds timeout{0};
};

struct GenerationResponse {
    int status_code = 0;
    std::string answer;
    std::vector<std::string> sources;
};

/**
 * @brief Turns a plaintext transcript into a reply
 *
 * Err means a transport failure or timeout; a status_code outside 200..299 is
 * a non-success answer. The pipeline treats both the same way.
 *
 * Implementations must give up once request.timeout has elapsed and return
 * Err. The pipeline cannot interrupt a running call; it only discards a
 * reply that arrives late, so a backend that never returns blocks the turn.
 */
class IGenerationBackend {
public:
    virtual ~IGenerationBackend() = default;
    [[nodiscard]] virtual Result<GenerationResponse, VaultFailure> Generate(
        const GenerationRequest& request) = 0;
};
}
