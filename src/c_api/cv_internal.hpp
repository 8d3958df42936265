/**
 * @file cv_internal.hpp
 * @brief Internal types and helpers for the chatvault C API
 *
 * Not part of the public API.
 */

#ifndef CV_INTERNAL_HPP
#define CV_INTERNAL_HPP

#include "chatvault/c_api/chatvault_c_api.h"
#include "chatvault/interfaces/i_generation_backend.hpp"
#include "chatvault/interfaces/i_session_repository.hpp"
#include "chatvault/pipeline/message_pipeline.hpp"
#include "chatvault/core/result.hpp"
#include "chatvault/vault.pb.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

/**
 * @brief Opaque handle owning one vault: store, codec and pipeline
 */
struct CvVaultHandle {
    std::shared_ptr<chatvault::interfaces::ISessionRepository> repository;
    std::unique_ptr<chatvault::pipeline::MessagePipeline> pipeline;
};

namespace cv::internal {

using chatvault::Result;
using chatvault::VaultFailure;

/**
 * @brief Ensure libsodium is initialized
 */
CvErrorCode EnsureInitialized();

void fill_error(CvError* out_error, CvErrorCode code, const std::string& message);

/**
 * @brief Map a VaultFailure to its error code and fill the error struct
 */
CvErrorCode fill_error_from_failure(CvError* out_error, const VaultFailure& failure);

bool validate_buffer_param(const uint8_t* data, size_t length, CvError* out_error);

bool validate_pointer(const void* pointer, const char* name, CvError* out_error);

/**
 * @brief Copy data to a library-allocated output buffer
 */
bool copy_to_buffer(std::span<const uint8_t> input, CvBuffer* out_buffer, CvError* out_error);

/**
 * @brief Serialize a protobuf message into a library-allocated output buffer
 */
bool serialize_to_buffer(const google::protobuf::MessageLite& message, CvBuffer* out_buffer, CvError* out_error);

/**
 * @brief Timeout as carried in GenerationRequest.timeout_ms, saturating at UINT32_MAX
 */
uint32_t to_wire_timeout(std::chrono::milliseconds timeout) noexcept;

void to_proto(const chatvault::models::EncryptionMetadata& metadata, chatvault::proto::EncryptionMetadata* out);

chatvault::models::MetadataFields from_proto(const chatvault::proto::EncryptionMetadata& metadata);

void to_proto(const chatvault::models::MessageRecord& message, chatvault::proto::StoredMessage* out);

/**
 * @brief IGenerationBackend over a host callback
 *
 * Requests and replies cross the boundary as serialized protobuf. Both
 * buffers hold plaintext and are wiped after use.
 */
class CallbackGenerationBackend final : public chatvault::interfaces::IGenerationBackend {
public:
    CallbackGenerationBackend(CvGenerateCallback callback, void* user_data);

    Result<chatvault::interfaces::GenerationResponse, VaultFailure> Generate(
        const chatvault::interfaces::GenerationRequest& request) override;

private:
    CvGenerateCallback callback_;
    void* user_data_;
};

} // namespace cv::internal

#endif // CV_INTERNAL_HPP
