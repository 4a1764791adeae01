#pragma once

#include "mpu/upload/file_handle.hpp"
#include "mpu/upload/options.hpp"
#include "mpu/upload/types.hpp"

#include <cstdint>
#include <vector>

namespace mpu::upload {

/// Smallest part size accepted by multipart stores (except the last part).
inline constexpr std::uint64_t kMinPartSize = 5 * kMiB;

/// Largest number of parts a multipart upload may have.
inline constexpr std::uint64_t kMaxPartCount = 10000;

/**
 * @brief Ordered, immutable partition of a file into parts
 *
 * `chunks` and `states` have the same length and ordering. Hooks on the
 * descriptors are left unset for the session to bind.
 */
struct ChunkPlan {
    std::vector<ChunkDescriptor> chunks;
    std::vector<ChunkState> states;
    bool multipart = false;
    std::uint64_t chunk_size = 0; ///< Size of every part except possibly the last
};

/// ceil(file.size() / kMaxPartCount); the default chunk size callback.
std::uint64_t default_chunk_size(const FileHandle& file);

/// max(desired, max(kMinPartSize, ceil(file_size / kMaxPartCount)))
[[nodiscard]] std::uint64_t compute_chunk_size(std::uint64_t file_size, std::uint64_t desired) noexcept;

/**
 * @brief Evaluate a multipart policy against @p file
 *
 * @throws ConfigurationError if a predicate policy is empty or throws
 */
bool resolve_multipart(const MultipartPolicy& policy, const FileHandle& file);

/**
 * @brief Plan the parts of @p file
 *
 * Without multipart the plan is one descriptor covering the whole file.
 * With multipart the file is cut into consecutive ranges of
 * compute_chunk_size() bytes, the last one clipped. An empty file always
 * yields one empty descriptor. @p get_chunk_size is only consulted for
 * multipart plans; an empty function means default_chunk_size().
 */
ChunkPlan plan_chunks(const FileHandle& file,
                      const MultipartPolicy& policy,
                      const ChunkSizeFn& get_chunk_size);

} // namespace mpu::upload
