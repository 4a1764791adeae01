#pragma once

#include "mpu/core/result.hpp"
#include "mpu/upload/cancellation.hpp"
#include "mpu/upload/file_handle.hpp"
#include "mpu/upload/options.hpp"
#include "mpu/upload/transport.hpp"
#include "mpu/upload/types.hpp"

#include <spdlog/logger.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace mpu::upload {

/**
 * @brief Lifecycle of one file upload
 *
 * Plans the parts of a file, drives a Transport through start/pause/resume
 * and abort, aggregates per-part progress and reports outward through the
 * callbacks in UploaderOptions.
 *
 * State machine:
 *   Idle --start--> Active --pause--> Paused --start--> Active
 *   Active --start--> Active            (restart: resumes the transport)
 *   Active --settled--> Succeeded | Failed
 *   Idle/Active/Paused --abort(really)--> Aborting --remote abort--> Aborted
 *
 * Every transport attempt runs under its own cancellation token. Pausing,
 * restarting and aborting cancel the current token before a new one is
 * issued; the resulting Cancelled settlement is filtered out and never
 * reaches on_error.
 *
 * Sessions are single-threaded: all calls and all transport callbacks must
 * happen on the same thread (typically the one running the io_context).
 * The FileHandle and Transport are borrowed and must outlive the session.
 * Hooks handed to the transport hold a weak reference, so callbacks that
 * arrive after the session was destroyed are ignored.
 */
class UploadSession : public std::enable_shared_from_this<UploadSession> {
public:
    /**
     * @throws ConfigurationError if the multipart policy is invalid or fails
     */
    static std::shared_ptr<UploadSession> create(const FileHandle& file,
                                                 Transport& transport,
                                                 UploaderOptions options = {});

    ~UploadSession();

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    /**
     * @brief Begin the upload, or resume it after a pause or while active
     *
     * @return Error if the session is aborting or already finished
     */
    mpu::Result<void> start();

    /// Suspend the in-flight attempt. No-op unless the session is active.
    void pause();

    /**
     * @brief Stop the upload
     *
     * Without `really` this is pause(). With it, the local attempt is
     * cancelled immediately and the transport is asked to release the
     * remote upload; the session becomes Aborted when that call resolves,
     * whatever its outcome.
     */
    void abort(AbortOptions options = {});

    [[nodiscard]] UploadState state() const noexcept { return state_; }
    [[nodiscard]] const FileHandle& file() const noexcept { return file_; }
    [[nodiscard]] bool is_multipart() const noexcept { return multipart_; }
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }

    [[nodiscard]] const std::vector<ChunkDescriptor>& chunks() const noexcept { return chunks_; }

    /// Per-part bookkeeping, in part order.
    [[nodiscard]] const std::vector<ChunkState>& chunk_state() const noexcept { return chunk_state_; }

    [[nodiscard]] std::uint64_t total_uploaded() const noexcept;

private:
    enum class AttemptKind {
        Create,
        Resume
    };

    UploadSession(const FileHandle& file, Transport& transport, UploaderOptions options);

    void bind_hooks();
    void begin_attempt(AttemptKind kind);
    void settle(std::uint64_t attempt, UploadOutcome outcome);
    void finish_abort(const mpu::Result<void, TransportError>& result);

    void on_part_progress(std::size_t index, const ProgressEvent& event);
    void on_part_complete(std::size_t index, const std::string& etag);

    const FileHandle& file_;
    Transport& transport_;
    UploaderOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    std::vector<ChunkDescriptor> chunks_;
    std::vector<ChunkState> chunk_state_;
    bool multipart_ = false;
    std::uint64_t chunk_size_ = 0;

    CancellationSource cancel_source_;
    UploadState state_ = UploadState::Idle;
    std::uint64_t attempt_ = 0;   ///< Id of the newest attempt; 0 before start()
    bool in_flight_ = false;      ///< Newest attempt has not settled yet
};

} // namespace mpu::upload
