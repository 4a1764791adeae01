#include "mpu/upload/chunk_planner.hpp"

#include "mpu/core/errors.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace mpu::upload {
namespace {

std::uint64_t ceil_div(std::uint64_t numerator, std::uint64_t denominator) noexcept {
    return numerator / denominator + (numerator % denominator != 0 ? 1 : 0);
}

ChunkDescriptor make_descriptor(const FileHandle& file,
                                std::size_t index,
                                std::uint64_t begin,
                                std::uint64_t end,
                                bool multipart) {
    ChunkDescriptor chunk;
    chunk.index = index;
    chunk.begin = begin;
    chunk.end = end;
    chunk.uses_multipart = multipart;
    // Slicing is deferred until the transport asks for the data.
    chunk.get_data = [&file, begin, end]() { return file.slice(begin, end); };
    return chunk;
}

} // namespace

std::uint64_t default_chunk_size(const FileHandle& file) {
    return ceil_div(file.size(), kMaxPartCount);
}

std::uint64_t compute_chunk_size(std::uint64_t file_size, std::uint64_t desired) noexcept {
    const std::uint64_t min_chunk_size = std::max(kMinPartSize, ceil_div(file_size, kMaxPartCount));
    return std::max(desired, min_chunk_size);
}

bool resolve_multipart(const MultipartPolicy& policy, const FileHandle& file) {
    if (const auto* fixed = std::get_if<bool>(&policy)) {
        return *fixed;
    }

    const auto& predicate = std::get<std::function<bool(const FileHandle&)>>(policy);
    if (!predicate) {
        throw ConfigurationError("should_use_multipart predicate is empty");
    }
    try {
        return predicate(file);
    } catch (const std::exception& e) {
        throw ConfigurationError(std::string("should_use_multipart predicate failed for ")
                                 + file.name() + ": " + e.what());
    }
}

ChunkPlan plan_chunks(const FileHandle& file,
                      const MultipartPolicy& policy,
                      const ChunkSizeFn& get_chunk_size) {
    ChunkPlan plan;
    plan.multipart = resolve_multipart(policy, file);

    const std::uint64_t file_size = file.size();

    if (!plan.multipart) {
        plan.chunk_size = file_size;
        plan.chunks.push_back(make_descriptor(file, 0, 0, file_size, false));
        plan.states.resize(1);
        return plan;
    }

    const std::uint64_t desired = get_chunk_size ? get_chunk_size(file) : default_chunk_size(file);
    plan.chunk_size = compute_chunk_size(file_size, desired);

    if (file_size == 0) {
        plan.chunks.push_back(make_descriptor(file, 0, 0, 0, true));
        plan.states.resize(1);
        return plan;
    }

    const auto count = static_cast<std::size_t>(ceil_div(file_size, plan.chunk_size));
    plan.chunks.reserve(count);
    for (std::uint64_t begin = 0; begin < file_size; begin += plan.chunk_size) {
        const std::uint64_t end = std::min(file_size, begin + plan.chunk_size);
        plan.chunks.push_back(make_descriptor(file, plan.chunks.size(), begin, end, true));
    }
    plan.states.resize(plan.chunks.size());
    return plan;
}

} // namespace mpu::upload
