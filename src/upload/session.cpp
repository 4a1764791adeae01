#include "mpu/upload/session.hpp"

#include "mpu/upload/chunk_planner.hpp"
#include "mpu/upload/progress.hpp"

#include <string>
#include <utility>

namespace mpu::upload {

std::shared_ptr<UploadSession> UploadSession::create(const FileHandle& file,
                                                     Transport& transport,
                                                     UploaderOptions options) {
    std::shared_ptr<UploadSession> session(new UploadSession(file, transport, std::move(options)));
    session->bind_hooks();
    return session;
}

UploadSession::UploadSession(const FileHandle& file, Transport& transport, UploaderOptions options)
    : file_(file),
      transport_(transport),
      options_(with_defaults(std::move(options))),
      logger_(options_.logger) {

    auto plan = plan_chunks(file_, options_.should_use_multipart, options_.get_chunk_size);
    chunks_ = std::move(plan.chunks);
    chunk_state_ = std::move(plan.states);
    multipart_ = plan.multipart;
    chunk_size_ = plan.chunk_size;

    logger_->debug("Planned {} part(s) for {} ({} bytes, multipart={}, chunk_size={})",
        chunks_.size(), file_.name(), file_.size(), multipart_, chunk_size_);
}

UploadSession::~UploadSession() {
    if (in_flight_ && !cancel_source_.is_cancelled()) {
        cancel_source_.cancel(CancelReason::Pausing);
    }
}

void UploadSession::bind_hooks() {
    const std::weak_ptr<UploadSession> weak = weak_from_this();
    for (auto& chunk : chunks_) {
        const std::size_t index = chunk.index;
        chunk.on_progress = [weak, index](const ProgressEvent& event) {
            if (auto self = weak.lock()) {
                self->on_part_progress(index, event);
            }
        };
        chunk.on_complete = [weak, index](const std::string& etag) {
            if (auto self = weak.lock()) {
                self->on_part_complete(index, etag);
            }
        };
    }
}

mpu::Result<void> UploadSession::start() {
    switch (state_) {
        case UploadState::Idle:
            begin_attempt(AttemptKind::Create);
            return mpu::Ok();

        case UploadState::Active:
        case UploadState::Paused:
            if (in_flight_ && !cancel_source_.is_cancelled()) {
                cancel_source_.cancel(CancelReason::Pausing);
            }
            cancel_source_ = CancellationSource();
            begin_attempt(AttemptKind::Resume);
            return mpu::Ok();

        case UploadState::Aborting:
        case UploadState::Succeeded:
        case UploadState::Aborted:
        case UploadState::Failed:
            break;
    }
    return mpu::Err<void>(std::string("Cannot start upload of ") + file_.name()
                          + " in state " + to_string(state_));
}

void UploadSession::pause() {
    if (state_ != UploadState::Active) {
        return;
    }
    cancel_source_.cancel(CancelReason::Pausing);
    // The next start() must not inherit a cancelled token.
    cancel_source_ = CancellationSource();
    state_ = UploadState::Paused;
    logger_->info("Upload of {} paused at {}/{} bytes", file_.name(), total_uploaded(), file_.size());
}

void UploadSession::abort(AbortOptions options) {
    if (!options.really) {
        pause();
        return;
    }
    if (state_ == UploadState::Aborting || is_terminal(state_)) {
        return;
    }

    cancel_source_.cancel(CancelReason::Aborted);
    cancel_source_ = CancellationSource();
    state_ = UploadState::Aborting;
    logger_->info("Aborting upload of {}", file_.name());

    const std::weak_ptr<UploadSession> weak = weak_from_this();
    auto logger = logger_;
    const std::string name = file_.name();
    transport_.abort_file_upload(file_, [weak, logger, name](mpu::Result<void, TransportError> result) {
        if (auto self = weak.lock()) {
            self->finish_abort(result);
        } else if (result.is_error()) {
            logger->warn("Failed to abort remote upload of {}: {}", name, result.error().message);
        }
    });
}

std::uint64_t UploadSession::total_uploaded() const noexcept {
    return mpu::upload::total_uploaded(chunk_state_);
}

void UploadSession::begin_attempt(AttemptKind kind) {
    const std::uint64_t attempt = ++attempt_;
    state_ = UploadState::Active;
    in_flight_ = true;

    const std::weak_ptr<UploadSession> weak = weak_from_this();
    UploadCompletion on_settled = [weak, attempt](UploadOutcome outcome) {
        if (auto self = weak.lock()) {
            self->settle(attempt, std::move(outcome));
        }
    };

    if (kind == AttemptKind::Create) {
        logger_->info("Starting upload of {} ({} part(s))", file_.name(), chunks_.size());
        transport_.upload_file(file_, chunks_, cancel_source_.token(), std::move(on_settled));
    } else {
        logger_->info("Resuming upload of {} (attempt {})", file_.name(), attempt);
        transport_.resume_upload_file(file_, chunks_, cancel_source_.token(), std::move(on_settled));
    }
}

void UploadSession::settle(std::uint64_t attempt, UploadOutcome outcome) {
    if (attempt == attempt_) {
        in_flight_ = false;
    }

    const bool superseded = attempt != attempt_ || state_ != UploadState::Active;
    if (outcome.is_error() && is_cancellation(outcome.error())) {
        // Swallow only cancellations this session requested. The cancelled
        // source is still installed while its callbacks run.
        const auto reason = std::get<Cancelled>(outcome.error()).reason;
        if (is_intentional(reason) && (superseded || cancel_source_.is_cancelled())) {
            logger_->debug("Attempt {} for {} stopped: {}", attempt, file_.name(), describe(outcome.error()));
            return;
        }
    }
    if (superseded) {
        logger_->debug("Ignoring late settlement of attempt {} for {} (current attempt {}, state {})",
            attempt, file_.name(), attempt_, to_string(state_));
        return;
    }

    if (outcome.is_ok()) {
        state_ = UploadState::Succeeded;
        logger_->info("Upload of {} complete: {}", file_.name(), outcome.value().location);
        options_.on_success(outcome.value());
        return;
    }

    state_ = UploadState::Failed;
    const TransportError error = as_transport_error(outcome.error());
    logger_->error("Upload of {} failed: {}", file_.name(), error.message);
    options_.on_error(error);
}

void UploadSession::finish_abort(const mpu::Result<void, TransportError>& result) {
    if (result.is_error()) {
        logger_->warn("Failed to abort remote upload of {}: {}", file_.name(), result.error().message);
    }
    state_ = UploadState::Aborted;
    logger_->info("Upload of {} aborted", file_.name());
}

void UploadSession::on_part_progress(std::size_t index, const ProgressEvent& event) {
    if (!event.length_computable) {
        return;
    }
    const std::uint64_t loaded = ensure_int(event.loaded);

    auto& state = chunk_state_[index];
    if (state.done) {
        return;
    }
    state.uploaded_bytes = loaded;
    options_.on_progress(total_uploaded(), file_.size());
}

void UploadSession::on_part_complete(std::size_t index, const std::string& etag) {
    auto& state = chunk_state_[index];
    if (state.done) {
        logger_->debug("Part {} of {} already complete", index + 1, file_.name());
        return;
    }

    // Drop the data accessor so finished parts stop pinning file slices.
    chunks_[index].release();
    state.etag = etag;
    state.done = true;

    logger_->debug("Part {} of {} stored (etag {})", index + 1, file_.name(), etag);
    options_.on_part_complete(PartInfo{static_cast<std::uint32_t>(index + 1), etag});
}

} // namespace mpu::upload
