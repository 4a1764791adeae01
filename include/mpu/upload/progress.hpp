#pragma once

#include "mpu/upload/types.hpp"

#include <cstdint>
#include <vector>

namespace mpu::upload {

/**
 * @brief Normalize a transport-reported byte count
 *
 * Accepts unsigned integers, finite non-negative doubles (truncated) and
 * strings of decimal digits. Anything else is a transport defect and throws
 * std::invalid_argument.
 */
std::uint64_t ensure_int(const ProgressValue& value);

/// Sum of uploaded_bytes across all parts.
std::uint64_t total_uploaded(const std::vector<ChunkState>& states) noexcept;

} // namespace mpu::upload
