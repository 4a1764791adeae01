#pragma once

#include "mpu/core/result.hpp"
#include "mpu/upload/cancellation.hpp"
#include "mpu/upload/file_handle.hpp"
#include "mpu/upload/types.hpp"

#include <functional>
#include <vector>

namespace mpu::upload {

using UploadOutcome = mpu::Result<UploadResult, UploadFailure>;
using UploadCompletion = std::function<void(UploadOutcome)>;
using AbortCompletion = std::function<void(mpu::Result<void, TransportError>)>;

/**
 * @brief Performs the actual network work for an upload session
 *
 * Contract shared by upload_file() and resume_upload_file():
 * - call each descriptor's on_progress/on_complete hooks as parts progress;
 * - call data() only when a part is about to be sent, and skip released
 *   descriptors (those parts are already stored);
 * - observe @p token and, once it is cancelled, stop calling hooks and
 *   settle with Cancelled{token.reason()};
 * - invoke @p on_settled exactly once.
 *
 * @p chunks is owned by the session and stays valid while the session
 * lives; its length and ordering never change.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual void upload_file(const FileHandle& file,
                             const std::vector<ChunkDescriptor>& chunks,
                             CancellationToken token,
                             UploadCompletion on_settled) = 0;

    virtual void resume_upload_file(const FileHandle& file,
                                    const std::vector<ChunkDescriptor>& chunks,
                                    CancellationToken token,
                                    UploadCompletion on_settled) = 0;

    /// Best-effort release of server-side resources of an unfinished upload.
    virtual void abort_file_upload(const FileHandle& file, AbortCompletion on_done) = 0;
};

} // namespace mpu::upload
