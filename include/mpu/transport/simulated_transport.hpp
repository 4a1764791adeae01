#pragma once

#include "mpu/upload/transport.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace mpu::transport {

namespace asio = boost::asio;

/**
 * @brief In-process Transport that "uploads" by reading the file on an io_context
 *
 * Parts are sent one at a time. Each timer tick reads the next slice of the
 * current part, reports absolute progress for it and, once the part is fully
 * read, completes it with an ETag derived from its bytes. Stored parts are
 * remembered per file so resume_upload_file() only sends what is missing,
 * the way a real multipart store lists the parts of an upload id.
 *
 * Thread safety:
 * - Single-threaded; all work runs on the io_context passed in
 * - The transport must outlive every operation it started
 *
 * Usage:
 * ```cpp
 * asio::io_context io;
 * SimulatedTransport transport(io);
 * auto session = UploadSession::create(file, transport, options);
 * session->start();
 * io.run();
 * ```
 */
class SimulatedTransport final : public upload::Transport {
public:
    struct Options {
        std::uint64_t progress_step = 256 * 1024;          ///< Bytes read per tick
        std::chrono::milliseconds tick{1};
        std::optional<std::size_t> fail_part;            ///< Part index that fails once
        int fail_code = 500;
        std::string fail_message = "simulated part failure";
        bool fail_abort = false;                         ///< abort_file_upload() reports an error
        std::string location_prefix = "sim://uploads";
    };

    explicit SimulatedTransport(asio::io_context& io_context);

    /// @throws ConfigurationError if options.progress_step is 0
    SimulatedTransport(asio::io_context& io_context, Options options);

    void upload_file(const upload::FileHandle& file,
                     const std::vector<upload::ChunkDescriptor>& chunks,
                     upload::CancellationToken token,
                     upload::UploadCompletion on_settled) override;

    void resume_upload_file(const upload::FileHandle& file,
                            const std::vector<upload::ChunkDescriptor>& chunks,
                            upload::CancellationToken token,
                            upload::UploadCompletion on_settled) override;

    void abort_file_upload(const upload::FileHandle& file, upload::AbortCompletion on_done) override;

    /// Part index -> ETag of every part stored by the open remote upload of @p file_name.
    [[nodiscard]] const std::map<std::size_t, std::string>& stored_parts(const std::string& file_name) const;

    /// Upload id of the open remote upload of @p file_name, empty if there is none.
    [[nodiscard]] std::string upload_id(const std::string& file_name) const;

    [[nodiscard]] std::size_t upload_calls() const noexcept { return upload_calls_; }
    [[nodiscard]] std::size_t resume_calls() const noexcept { return resume_calls_; }
    [[nodiscard]] std::size_t abort_calls() const noexcept { return abort_calls_; }

private:
    class Operation;

    /// Server-side state of one multipart upload.
    struct RemoteUpload {
        std::string upload_id;
        std::map<std::size_t, std::string> parts;
    };

    RemoteUpload& remote_upload(const std::string& file_name);

    void launch(const upload::FileHandle& file,
                const std::vector<upload::ChunkDescriptor>& chunks,
                upload::CancellationToken token,
                upload::UploadCompletion on_settled);

    asio::io_context& io_context_;
    Options options_;
    std::map<std::string, RemoteUpload> uploads_;  ///< Keyed by file name
    bool fail_part_pending_ = false;
    std::uint64_t upload_counter_ = 0;

    std::size_t upload_calls_ = 0;
    std::size_t resume_calls_ = 0;
    std::size_t abort_calls_ = 0;
};

} // namespace mpu::transport
