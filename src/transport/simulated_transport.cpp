#include "mpu/transport/simulated_transport.hpp"

#include "mpu/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <memory>
#include <sstream>

namespace mpu::transport {

using upload::ByteRange;
using upload::CancellationToken;
using upload::Cancelled;
using upload::ChunkDescriptor;
using upload::FileHandle;
using upload::PartInfo;
using upload::ProgressEvent;
using upload::TransportError;
using upload::UploadCompletion;
using upload::UploadFailure;
using upload::UploadOutcome;
using upload::UploadResult;

namespace {

constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;

std::uint64_t fnv1a(std::uint64_t hash, const std::vector<std::uint8_t>& data) {
    for (std::uint8_t byte : data) {
        hash ^= static_cast<std::uint64_t>(byte);
        hash *= kFnvPrime;
    }
    return hash;
}

std::string to_hex(std::uint64_t value) {
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(value) * 2) << std::setfill('0') << value;
    return oss.str();
}

UploadOutcome failure(UploadFailure reason) {
    return mpu::Err<UploadResult>(std::move(reason));
}

} // namespace

// ──────────────────────────────────────────────────────────
// Operation: one upload attempt
// ──────────────────────────────────────────────────────────

class SimulatedTransport::Operation : public std::enable_shared_from_this<Operation> {
public:
    Operation(SimulatedTransport& transport,
              const FileHandle& file,
              const std::vector<ChunkDescriptor>& chunks,
              CancellationToken token,
              UploadCompletion on_settled)
        : transport_(transport),
          file_(file),
          chunks_(chunks),
          token_(std::move(token)),
          on_settled_(std::move(on_settled)),
          timer_(transport.io_context_) {}

    void start() {
        const std::weak_ptr<Operation> weak = weak_from_this();
        cancel_id_ = token_.on_cancel([weak](upload::CancelReason) {
            if (auto self = weak.lock()) {
                self->timer_.cancel();
            }
        });
        schedule();
    }

private:
    void schedule() {
        auto self = shared_from_this();  // Keep the attempt alive while the timer is pending
        timer_.expires_after(transport_.options_.tick);
        timer_.async_wait([this, self](boost::system::error_code ec) {
            step(ec);
        });
    }

    void step(boost::system::error_code ec) {
        if (token_.is_cancelled()) {
            finish(failure(Cancelled{token_.reason()}));
            return;
        }
        if (ec) {
            finish(failure(TransportError{ec.value(), ec.message()}));
            return;
        }

        skip_stored_parts();
        if (current_ == chunks_.size()) {
            finish(mpu::Ok<UploadResult, UploadFailure>(make_result()));
            return;
        }

        const ChunkDescriptor& chunk = chunks_[current_];
        if (!range_) {
            range_ = chunk.data();
            sent_ = 0;
            hash_ = kFnvOffset;
        }

        if (transport_.fail_part_pending_ && transport_.options_.fail_part == current_) {
            transport_.fail_part_pending_ = false;
            spdlog::debug("Simulating failure of part {} of {}", current_ + 1, file_.name());
            finish(failure(TransportError{transport_.options_.fail_code, transport_.options_.fail_message}));
            return;
        }

        auto bytes = range_->read(sent_, transport_.options_.progress_step);
        if (bytes.is_error()) {
            finish(failure(TransportError{-1, bytes.error()}));
            return;
        }
        hash_ = fnv1a(hash_, bytes.value());
        sent_ += bytes.value().size();

        chunk.on_progress(ProgressEvent{true, sent_, range_->size()});
        // Hooks may pause, abort or destroy the session; chunks_ is only
        // valid while the token is live.
        if (token_.is_cancelled()) {
            finish(failure(Cancelled{token_.reason()}));
            return;
        }

        if (sent_ >= range_->size()) {
            const std::string etag = to_hex(hash_);
            transport_.remote_upload(file_.name()).parts[current_] = etag;
            range_.reset();
            ++current_;
            chunk.on_complete(etag);
        }

        schedule();
    }

    void skip_stored_parts() {
        if (range_) {
            return;
        }
        const auto& stored = transport_.remote_upload(file_.name()).parts;
        while (current_ < chunks_.size()
               && (chunks_[current_].released() || stored.count(current_) > 0)) {
            ++current_;
        }
    }

    UploadResult make_result() const {
        UploadResult result;
        result.key = file_.name();
        result.location = transport_.options_.location_prefix + "/" + file_.name();
        if (!chunks_.empty() && chunks_.front().uses_multipart) {
            const auto& remote = transport_.remote_upload(file_.name());
            result.upload_id = remote.upload_id;
            for (const auto& [index, etag] : remote.parts) {
                result.parts.push_back(PartInfo{static_cast<std::uint32_t>(index + 1), etag});
            }
        }
        return result;
    }

    void finish(UploadOutcome outcome) {
        if (settled_) {
            return;
        }
        settled_ = true;
        token_.remove_callback(cancel_id_);
        on_settled_(std::move(outcome));
    }

    SimulatedTransport& transport_;
    const FileHandle& file_;
    const std::vector<ChunkDescriptor>& chunks_;
    CancellationToken token_;
    UploadCompletion on_settled_;
    asio::steady_timer timer_;

    std::size_t cancel_id_ = 0;
    std::size_t current_ = 0;
    std::optional<ByteRange> range_;
    std::uint64_t sent_ = 0;
    std::uint64_t hash_ = kFnvOffset;
    bool settled_ = false;
};

// ──────────────────────────────────────────────────────────
// SimulatedTransport
// ──────────────────────────────────────────────────────────

SimulatedTransport::SimulatedTransport(asio::io_context& io_context)
    : SimulatedTransport(io_context, Options{}) {}

SimulatedTransport::SimulatedTransport(asio::io_context& io_context, Options options)
    : io_context_(io_context),
      options_(std::move(options)),
      fail_part_pending_(options_.fail_part.has_value()) {
    if (options_.progress_step == 0) {
        throw ConfigurationError("SimulatedTransport progress_step must be positive");
    }
}

const std::map<std::size_t, std::string>& SimulatedTransport::stored_parts(const std::string& file_name) const {
    static const std::map<std::size_t, std::string> kNoParts;
    const auto it = uploads_.find(file_name);
    return it == uploads_.end() ? kNoParts : it->second.parts;
}

std::string SimulatedTransport::upload_id(const std::string& file_name) const {
    const auto it = uploads_.find(file_name);
    return it == uploads_.end() ? std::string() : it->second.upload_id;
}

SimulatedTransport::RemoteUpload& SimulatedTransport::remote_upload(const std::string& file_name) {
    auto [it, created] = uploads_.try_emplace(file_name);
    if (created) {
        it->second.upload_id = "sim-upload-" + std::to_string(++upload_counter_);
    }
    return it->second;
}

void SimulatedTransport::upload_file(const FileHandle& file,
                                     const std::vector<ChunkDescriptor>& chunks,
                                     CancellationToken token,
                                     UploadCompletion on_settled) {
    ++upload_calls_;
    uploads_.erase(file.name());
    const auto& remote = remote_upload(file.name());
    spdlog::debug("Simulated upload {} of {} ({} part(s))", remote.upload_id, file.name(), chunks.size());
    launch(file, chunks, std::move(token), std::move(on_settled));
}

void SimulatedTransport::resume_upload_file(const FileHandle& file,
                                            const std::vector<ChunkDescriptor>& chunks,
                                            CancellationToken token,
                                            UploadCompletion on_settled) {
    ++resume_calls_;
    spdlog::debug("Simulated resume of {} ({} part(s) already stored)", file.name(), stored_parts(file.name()).size());
    launch(file, chunks, std::move(token), std::move(on_settled));
}

void SimulatedTransport::abort_file_upload(const FileHandle& file, upload::AbortCompletion on_done) {
    ++abort_calls_;
    const std::string name = file.name();
    asio::post(io_context_, [this, name, on_done = std::move(on_done)]() {
        if (options_.fail_abort) {
            on_done(mpu::Err<void>(TransportError{503, "simulated abort failure for " + name}));
            return;
        }
        spdlog::debug("Simulated abort of {} released {} part(s)", name, stored_parts(name).size());
        uploads_.erase(name);
        on_done(mpu::Ok<TransportError>());
    });
}

void SimulatedTransport::launch(const FileHandle& file,
                                const std::vector<ChunkDescriptor>& chunks,
                                CancellationToken token,
                                UploadCompletion on_settled) {
    auto operation = std::make_shared<Operation>(*this, file, chunks, std::move(token), std::move(on_settled));
    operation->start();
}

} // namespace mpu::transport
