#pragma once

#include "mpu/core/result.hpp"
#include "mpu/upload/options.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace mpu::upload {

/**
 * @brief Uploader settings that can be expressed in a JSON document
 *
 * Example:
 * {
 *   "chunk_size": 8388608,
 *   "multipart": {"min_file_size": 104857600},
 *   "log_level": "debug"
 * }
 *
 * `multipart` is either a boolean or an object whose `min_file_size`
 * enables multipart for files of at least that many bytes.
 */
struct UploaderConfig {
    std::optional<std::uint64_t> chunk_size;
    bool multipart = false;
    std::optional<std::uint64_t> multipart_min_file_size;
    spdlog::level::level_enum log_level = spdlog::level::info;
};

/**
 * @throws ConfigurationError on unknown value types or invalid values
 */
UploaderConfig parse_config(const nlohmann::json& document);

/// Reads and parses a JSON config file; all failures become error results.
mpu::Result<UploaderConfig> load_config_file(const std::filesystem::path& path);

/// Fill the chunk size and multipart policy of @p options from @p config.
void apply_config(const UploaderConfig& config, UploaderOptions& options);

} // namespace mpu::upload
