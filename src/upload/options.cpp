#include "mpu/upload/options.hpp"

#include "mpu/upload/chunk_planner.hpp"

#include <spdlog/spdlog.h>

namespace mpu::upload {

UploaderOptions with_defaults(UploaderOptions options) {
    if (!options.get_chunk_size) {
        options.get_chunk_size = default_chunk_size;
    }
    if (!options.on_progress) {
        options.on_progress = [](std::uint64_t, std::uint64_t) {};
    }
    if (!options.on_part_complete) {
        options.on_part_complete = [](const PartInfo&) {};
    }
    if (!options.on_success) {
        options.on_success = [](const UploadResult&) {};
    }
    if (!options.on_error) {
        options.on_error = [](const TransportError& error) { throw UploadFailedException(error); };
    }
    if (!options.logger) {
        options.logger = spdlog::default_logger();
    }
    return options;
}

} // namespace mpu::upload
