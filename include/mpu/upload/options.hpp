#pragma once

#include "mpu/upload/file_handle.hpp"
#include "mpu/upload/types.hpp"

#include <spdlog/logger.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <variant>

namespace mpu::upload {

using ChunkSizeFn = std::function<std::uint64_t(const FileHandle&)>;

/// Either a fixed decision or a predicate evaluated once per session.
using MultipartPolicy = std::variant<bool, std::function<bool(const FileHandle&)>>;

/**
 * @brief Caller-facing configuration of an upload session
 *
 * Unset callbacks fall back to defaults when the session is created: the
 * progress, part and success callbacks do nothing, the error callback
 * throws UploadFailedException and the logger is spdlog's default logger.
 */
struct UploaderOptions {
    ChunkSizeFn get_chunk_size;
    MultipartPolicy should_use_multipart = false;

    std::function<void(std::uint64_t uploaded, std::uint64_t total)> on_progress;
    std::function<void(const PartInfo&)> on_part_complete;
    std::function<void(const UploadResult&)> on_success;
    std::function<void(const TransportError&)> on_error;

    std::shared_ptr<spdlog::logger> logger;
};

/// Copy of @p options with every unset member replaced by its default.
UploaderOptions with_defaults(UploaderOptions options);

} // namespace mpu::upload
