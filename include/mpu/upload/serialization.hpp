#pragma once

#include "mpu/upload/session.hpp"
#include "mpu/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace mpu::upload {

nlohmann::json chunk_state_to_json(const ChunkState& state);
nlohmann::json chunk_states_to_json(const std::vector<ChunkState>& states);
nlohmann::json part_to_json(const PartInfo& part);
nlohmann::json upload_result_to_json(const UploadResult& result);

/**
 * @brief Diagnostics view of a session
 *
 * Keys: file, size, state, multipart, chunk_size, uploaded, parts_done,
 * chunks (per-part uploaded/etag/done in part order).
 */
nlohmann::json session_snapshot_to_json(const UploadSession& session);

} // namespace mpu::upload
