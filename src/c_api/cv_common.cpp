/**
 * @file cv_common.cpp
 * @brief Helpers shared by the chatvault C API entry points
 */

#include "cv_internal.hpp"
#include "chatvault/crypto/encoding.hpp"
#include "chatvault/crypto/sodium_interop.hpp"
#include "chatvault/models/timestamp.hpp"
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <mutex>
#include <new>
#include <vector>

using namespace chatvault;
using chatvault::crypto::Encoding;
using chatvault::crypto::SodiumInterop;

namespace cv::internal {

CvErrorCode EnsureInitialized() {
    static std::once_flag init_flag;
    static std::atomic init_success{false};

    std::call_once(init_flag, [] {
        const auto result = SodiumInterop::Initialize();
        init_success.store(result.IsOk(), std::memory_order_release);
    });

    return init_success.load(std::memory_order_acquire)
               ? CV_SUCCESS
               : CV_ERROR_SODIUM_FAILURE;
}

void fill_error(CvError* out_error, const CvErrorCode code, const std::string& message) {
    if (out_error) {
        out_error->code = code;
        out_error->message = strdup(message.c_str());
    }
}

CvErrorCode fill_error_from_failure(CvError* out_error, const VaultFailure& failure) {
    CvErrorCode code = CV_ERROR_GENERIC;

    switch (failure.type) {
        case VaultFailureType::Generic:
            code = CV_ERROR_GENERIC;
            break;
        case VaultFailureType::InvalidInput:
            code = CV_ERROR_INVALID_INPUT;
            break;
        case VaultFailureType::Validation:
            code = CV_ERROR_VALIDATION;
            break;
        case VaultFailureType::AccessDenied:
            code = CV_ERROR_ACCESS_DENIED;
            break;
        case VaultFailureType::Integrity:
            code = CV_ERROR_INTEGRITY;
            break;
        case VaultFailureType::Decryption:
            code = CV_ERROR_DECRYPTION;
            break;
        case VaultFailureType::Encryption:
            code = CV_ERROR_ENCRYPTION;
            break;
        case VaultFailureType::DeriveKey:
            code = CV_ERROR_DERIVE_KEY;
            break;
        case VaultFailureType::Storage:
            code = CV_ERROR_STORAGE;
            break;
        case VaultFailureType::UpstreamUnavailable:
            code = CV_ERROR_UPSTREAM_UNAVAILABLE;
            break;
        case VaultFailureType::Cancelled:
            code = CV_ERROR_CANCELLED;
            break;
    }

    fill_error(out_error, code, failure.message);
    return code;
}

bool validate_buffer_param(const uint8_t* data, const size_t length, CvError* out_error) {
    if (!data && length > 0) {
        fill_error(out_error, CV_ERROR_NULL_POINTER, "Buffer data is null but length is non-zero");
        return false;
    }
    return true;
}

bool validate_pointer(const void* pointer, const char* name, CvError* out_error) {
    if (!pointer) {
        fill_error(out_error, CV_ERROR_NULL_POINTER, std::string(name) + " is null");
        return false;
    }
    return true;
}

bool copy_to_buffer(const std::span<const uint8_t> input, CvBuffer* out_buffer, CvError* out_error) {
    if (!out_buffer) {
        fill_error(out_error, CV_ERROR_NULL_POINTER, "Output buffer is null");
        return false;
    }
    out_buffer->data = nullptr;
    out_buffer->length = 0;
    if (input.empty()) {
        return true;
    }

    auto* data = new(std::nothrow) uint8_t[input.size()];
    if (!data) {
        fill_error(out_error, CV_ERROR_OUT_OF_MEMORY, "Failed to allocate output buffer");
        return false;
    }
    std::memcpy(data, input.data(), input.size());
    out_buffer->data = data;
    out_buffer->length = input.size();
    return true;
}

bool serialize_to_buffer(const google::protobuf::MessageLite& message, CvBuffer* out_buffer, CvError* out_error) {
    std::vector<uint8_t> bytes(message.ByteSizeLong());
    if (!message.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
        fill_error(out_error, CV_ERROR_DECODE, "Failed to serialize response");
        return false;
    }
    return copy_to_buffer(bytes, out_buffer, out_error);
}

uint32_t to_wire_timeout(const std::chrono::milliseconds timeout) noexcept {
    if (timeout.count() <= 0) {
        return 0;
    }
    if (static_cast<uint64_t>(timeout.count()) > std::numeric_limits<uint32_t>::max()) {
        return std::numeric_limits<uint32_t>::max();
    }
    return static_cast<uint32_t>(timeout.count());
}

void to_proto(const models::EncryptionMetadata& metadata, proto::EncryptionMetadata* out) {
    out->set_algorithm(std::string(models::AlgorithmTag(metadata.algorithm)));
    out->set_key_id(metadata.key_id);
    out->set_iv(metadata.iv);
    out->set_created_at(metadata.created_at);
}

models::MetadataFields from_proto(const proto::EncryptionMetadata& metadata) {
    return models::MetadataFields{
        .algorithm = metadata.algorithm(),
        .key_id = metadata.key_id(),
        .iv = metadata.iv(),
        .created_at = metadata.created_at()};
}

void to_proto(const models::MessageRecord& message, proto::StoredMessage* out) {
    out->set_id(message.id);
    out->set_session_id(message.session_id);
    out->set_role(std::string(models::RoleTag(message.role)));
    out->set_encrypted_content(Encoding::ToBase64(message.ciphertext));
    to_proto(message.metadata, out->mutable_encryption_metadata());
    out->set_content_hash(message.content_hash);
    for (const auto& source : message.sources) {
        out->add_sources(source);
    }
    out->set_created_at(models::FormatIso8601(message.created_at));
}

CallbackGenerationBackend::CallbackGenerationBackend(const CvGenerateCallback callback, void* user_data)
    : callback_(callback), user_data_(user_data) {
}

Result<interfaces::GenerationResponse, VaultFailure> CallbackGenerationBackend::Generate(
    const interfaces::GenerationRequest& request) {
    using R = Result<interfaces::GenerationResponse, VaultFailure>;
    if (!callback_) {
        return R::Err(VaultFailure::UpstreamUnavailable("No generation backend configured"));
    }

    proto::GenerationRequest wire;
    wire.set_query(request.query);
    for (const auto& turn : request.history) {
        auto* entry = wire.add_history();
        entry->set_role(std::string(models::RoleTag(turn.role)));
        entry->set_content(turn.content);
    }
    wire.set_max_tokens(request.max_tokens);
    wire.set_timeout_ms(to_wire_timeout(request.timeout));

    std::vector<uint8_t> request_bytes(wire.ByteSizeLong());
    const bool serialized = wire.SerializeToArray(request_bytes.data(), static_cast<int>(request_bytes.size()));
    wire.Clear();
    if (!serialized) {
        return R::Err(VaultFailure::UpstreamUnavailable("Failed to serialize generation request"));
    }

    CvBuffer reply{nullptr, 0};
    const int32_t status = callback_(request_bytes.data(), request_bytes.size(), &reply, user_data_);
    auto wipe_request = SodiumInterop::SecureWipe(std::span<uint8_t>(request_bytes));
    (void)wipe_request;

    proto::GenerationReply parsed;
    const bool parsed_ok = status == 0 && reply.data != nullptr &&
                           parsed.ParseFromArray(reply.data, static_cast<int>(reply.length));
    if (reply.data) {
        auto wipe_reply = SodiumInterop::SecureWipe(std::span<uint8_t>(reply.data, reply.length));
        (void)wipe_reply;
        std::free(reply.data);
    }
    if (status != 0) {
        return R::Err(VaultFailure::UpstreamUnavailable("Generation callback reported a transport failure"));
    }
    if (!parsed_ok) {
        return R::Err(VaultFailure::UpstreamUnavailable("Generation callback returned an unreadable reply"));
    }

    interfaces::GenerationResponse response;
    response.status_code = parsed.status_code();
    response.answer = std::move(*parsed.mutable_answer());
    for (const auto& source : parsed.sources()) {
        response.sources.push_back(source.source());
    }
    return R::Ok(std::move(response));
}

} // namespace cv::internal
