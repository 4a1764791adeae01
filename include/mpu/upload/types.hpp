#pragma once

#include "mpu/upload/cancellation.hpp"
#include "mpu/upload/file_handle.hpp"

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace mpu::upload {

inline constexpr std::uint64_t kMiB = 1024 * 1024;

enum class UploadState {
    Idle,
    Active,
    Paused,
    Aborting,
    Succeeded,
    Aborted,
    Failed
};

const char* to_string(UploadState state) noexcept;

[[nodiscard]] inline bool is_terminal(UploadState state) noexcept {
    return state == UploadState::Succeeded || state == UploadState::Aborted || state == UploadState::Failed;
}

/// Byte count as delivered by a transport; strings carry decimal digits.
using ProgressValue = std::variant<std::uint64_t, double, std::string>;

/**
 * @brief Progress notification for one part
 *
 * `loaded` is the absolute number of bytes of this part sent so far in the
 * current attempt, not a delta.
 */
struct ProgressEvent {
    bool length_computable = true;
    ProgressValue loaded = std::uint64_t{0};
    std::uint64_t total = 0;
};

/**
 * @brief A stored part, as reported to on_part_complete
 */
struct PartInfo {
    std::uint32_t part_number = 0; ///< 1-based
    std::string etag;
};

/**
 * @brief Value produced by a transport once the whole file is stored
 */
struct UploadResult {
    std::string location;
    std::string key;
    std::string upload_id;      ///< Empty for single-request uploads
    std::vector<PartInfo> parts;
};

struct TransportError {
    int code = 0;
    std::string message;
};

/// TransportError code for an attempt cancelled by something other than the session.
inline constexpr int kCancelledErrorCode = 499;

/// An attempt stopped because its cancellation token fired.
struct Cancelled {
    CancelReason reason = CancelReason::Pausing;
};

using UploadFailure = std::variant<Cancelled, TransportError>;

[[nodiscard]] inline bool is_cancellation(const UploadFailure& failure) noexcept {
    return std::holds_alternative<Cancelled>(failure);
}

std::string describe(const UploadFailure& failure);

/// The failure as reported to on_error; an unrequested cancellation maps to kCancelledErrorCode.
TransportError as_transport_error(const UploadFailure& failure);

/**
 * @brief Raised by the default error callback
 */
class UploadFailedException : public std::runtime_error {
public:
    explicit UploadFailedException(TransportError error)
        : std::runtime_error("Upload failed: " + error.message), error_(std::move(error)) {}

    [[nodiscard]] const TransportError& error() const noexcept { return error_; }

private:
    TransportError error_;
};

/**
 * @brief One planned unit of upload
 *
 * The data accessor is evaluated only when a transport is ready to send the
 * part. Once the part is stored the session releases the descriptor, which
 * drops the accessor and leaves an empty placeholder at the same index.
 */
struct ChunkDescriptor {
    std::size_t index = 0;
    std::uint64_t begin = 0;
    std::uint64_t end = 0;
    bool uses_multipart = false;
    std::function<ByteRange()> get_data;
    std::function<void(const ProgressEvent&)> on_progress;
    std::function<void(const std::string&)> on_complete;

    [[nodiscard]] std::uint64_t size() const noexcept { return end - begin; }
    [[nodiscard]] bool released() const noexcept { return !get_data; }

    /// Throws std::logic_error on a released descriptor.
    ByteRange data() const;

    void release() noexcept;
};

/**
 * @brief Mutable bookkeeping for one part
 *
 * Once done is set, etag holds the completion token and uploaded_bytes is
 * frozen.
 */
struct ChunkState {
    std::uint64_t uploaded_bytes = 0;
    std::string etag;
    bool done = false;
};

struct AbortOptions {
    bool really = false; ///< Also release the remote upload
};

} // namespace mpu::upload
