#include "mpu/upload/types.hpp"

namespace mpu::upload {

const char* to_string(UploadState state) noexcept {
    switch (state) {
        case UploadState::Idle: return "idle";
        case UploadState::Active: return "active";
        case UploadState::Paused: return "paused";
        case UploadState::Aborting: return "aborting";
        case UploadState::Succeeded: return "succeeded";
        case UploadState::Aborted: return "aborted";
        case UploadState::Failed: return "failed";
    }
    return "unknown";
}

std::string describe(const UploadFailure& failure) {
    if (const auto* cancelled = std::get_if<Cancelled>(&failure)) {
        return std::string("cancelled (") + to_string(cancelled->reason) + ")";
    }
    const auto& error = std::get<TransportError>(failure);
    return "transport error " + std::to_string(error.code) + ": " + error.message;
}

TransportError as_transport_error(const UploadFailure& failure) {
    if (const auto* error = std::get_if<TransportError>(&failure)) {
        return *error;
    }
    return TransportError{kCancelledErrorCode, "Upload " + describe(failure) + " without being paused or aborted"};
}

ByteRange ChunkDescriptor::data() const {
    if (!get_data) {
        throw std::logic_error("Chunk " + std::to_string(index) + " was already released");
    }
    return get_data();
}

void ChunkDescriptor::release() noexcept {
    get_data = nullptr;
}

} // namespace mpu::upload
