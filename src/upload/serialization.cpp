#include "mpu/upload/serialization.hpp"

#include <algorithm>

namespace mpu::upload {

using json = nlohmann::json;

json chunk_state_to_json(const ChunkState& state) {
    json j;
    j["uploaded"] = state.uploaded_bytes;
    j["done"] = state.done;
    if (state.done) {
        j["etag"] = state.etag;
    }
    return j;
}

json chunk_states_to_json(const std::vector<ChunkState>& states) {
    json arr = json::array();
    for (const auto& state : states) {
        arr.push_back(chunk_state_to_json(state));
    }
    return arr;
}

json part_to_json(const PartInfo& part) {
    return json{{"PartNumber", part.part_number}, {"ETag", part.etag}};
}

json upload_result_to_json(const UploadResult& result) {
    json j;
    j["location"] = result.location;
    j["key"] = result.key;
    if (!result.upload_id.empty()) {
        j["upload_id"] = result.upload_id;
    }
    json parts = json::array();
    for (const auto& part : result.parts) {
        parts.push_back(part_to_json(part));
    }
    j["parts"] = std::move(parts);
    return j;
}

json session_snapshot_to_json(const UploadSession& session) {
    const auto& states = session.chunk_state();
    json j;
    j["file"] = session.file().name();
    j["size"] = session.file().size();
    j["state"] = to_string(session.state());
    j["multipart"] = session.is_multipart();
    j["chunk_size"] = session.chunk_size();
    j["uploaded"] = session.total_uploaded();
    j["parts_done"] = std::count_if(states.begin(), states.end(),
        [](const ChunkState& state) { return state.done; });
    j["chunks"] = chunk_states_to_json(states);
    return j;
}

} // namespace mpu::upload
