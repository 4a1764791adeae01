#include "mpu/upload/chunk_planner.hpp"

#include "mpu/core/errors.hpp"
#include "test_files.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <vector>

using mpu::ConfigurationError;
using mpu::test::SizedFile;
using mpu::upload::ChunkPlan;
using mpu::upload::FileHandle;
using mpu::upload::kMaxPartCount;
using mpu::upload::kMinPartSize;
using mpu::upload::kMiB;
using mpu::upload::MultipartPolicy;

namespace {

constexpr std::uint64_t kGiB = 1024 * kMiB;

MultipartPolicy predicate(std::function<bool(const FileHandle&)> fn) {
    return MultipartPolicy(std::move(fn));
}

void expect_partition(const ChunkPlan& plan, std::uint64_t file_size) {
    ASSERT_FALSE(plan.chunks.empty());
    ASSERT_EQ(plan.chunks.size(), plan.states.size());

    std::uint64_t expected_begin = 0;
    for (std::size_t i = 0; i < plan.chunks.size(); ++i) {
        const auto& chunk = plan.chunks[i];
        EXPECT_EQ(chunk.index, i);
        EXPECT_EQ(chunk.begin, expected_begin);
        EXPECT_TRUE(chunk.uses_multipart);
        if (i + 1 < plan.chunks.size()) {
            EXPECT_GE(chunk.size(), std::min(kMinPartSize, file_size));
        }
        expected_begin = chunk.end;
    }
    EXPECT_EQ(expected_begin, file_size);
    EXPECT_LE(plan.chunks.size(), kMaxPartCount);
}

} // namespace

TEST(ChunkPlannerTest, SinglePartCoversWholeFile) {
    for (std::uint64_t size : {std::uint64_t{0}, std::uint64_t{1}, 12 * kMiB, 64 * kGiB}) {
        SizedFile file(size);
        auto plan = mpu::upload::plan_chunks(file, false, nullptr);

        ASSERT_EQ(plan.chunks.size(), 1u) << "size " << size;
        EXPECT_FALSE(plan.multipart);
        EXPECT_FALSE(plan.chunks[0].uses_multipart);
        EXPECT_EQ(plan.chunks[0].begin, 0u);
        EXPECT_EQ(plan.chunks[0].end, size);

        const auto range = plan.chunks[0].data();
        EXPECT_EQ(range.begin(), 0u);
        EXPECT_EQ(range.end(), size);
        EXPECT_EQ(plan.states[0].uploaded_bytes, 0u);
        EXPECT_FALSE(plan.states[0].done);
    }
}

TEST(ChunkPlannerTest, EmptyFileYieldsOneEmptyChunk) {
    SizedFile file(0);

    auto single = mpu::upload::plan_chunks(file, false, nullptr);
    ASSERT_EQ(single.chunks.size(), 1u);
    EXPECT_TRUE(single.chunks[0].data().empty());

    auto multipart = mpu::upload::plan_chunks(file, true, nullptr);
    ASSERT_EQ(multipart.chunks.size(), 1u);
    EXPECT_TRUE(multipart.chunks[0].uses_multipart);
    EXPECT_TRUE(multipart.chunks[0].data().empty());
}

TEST(ChunkPlannerTest, SmallRequestedChunkSizeIsRaisedToMinimum) {
    SizedFile file(12 * kMiB);
    auto plan = mpu::upload::plan_chunks(file, true,
        [](const FileHandle&) { return 1 * kMiB; });

    EXPECT_EQ(plan.chunk_size, 5 * kMiB);
    ASSERT_EQ(plan.chunks.size(), 3u);
    EXPECT_EQ(plan.chunks[0].begin, 0u);
    EXPECT_EQ(plan.chunks[0].end, 5 * kMiB);
    EXPECT_EQ(plan.chunks[1].begin, 5 * kMiB);
    EXPECT_EQ(plan.chunks[1].end, 10 * kMiB);
    EXPECT_EQ(plan.chunks[2].begin, 10 * kMiB);
    EXPECT_EQ(plan.chunks[2].end, 12 * kMiB);
}

TEST(ChunkPlannerTest, LargerRequestedChunkSizeIsKept) {
    SizedFile file(20 * kMiB);
    auto plan = mpu::upload::plan_chunks(file, true,
        [](const FileHandle&) { return 8 * kMiB; });

    EXPECT_EQ(plan.chunk_size, 8 * kMiB);
    ASSERT_EQ(plan.chunks.size(), 3u);
    EXPECT_EQ(plan.chunks[2].size(), 4 * kMiB);
}

TEST(ChunkPlannerTest, PartCountNeverExceedsLimit) {
    for (std::uint64_t size : {5 * kMiB, 5 * kMiB + 1, 100 * kMiB + 7, 48 * kGiB + 3, 5 * 1024 * kGiB}) {
        SizedFile file(size);
        auto plan = mpu::upload::plan_chunks(file, true, nullptr);
        SCOPED_TRACE(size);
        expect_partition(plan, size);
    }
}

TEST(ChunkPlannerTest, ComputesChunkSize) {
    EXPECT_EQ(mpu::upload::compute_chunk_size(0, 0), kMinPartSize);
    EXPECT_EQ(mpu::upload::compute_chunk_size(12 * kMiB, 1 * kMiB), 5 * kMiB);
    EXPECT_EQ(mpu::upload::compute_chunk_size(12 * kMiB, 6 * kMiB), 6 * kMiB);

    const std::uint64_t huge = 100 * kGiB;
    EXPECT_EQ(mpu::upload::compute_chunk_size(huge, 0), (huge + kMaxPartCount - 1) / kMaxPartCount);
}

TEST(ChunkPlannerTest, DefaultChunkSizeSpreadsOverMaxParts) {
    EXPECT_EQ(mpu::upload::default_chunk_size(SizedFile(0)), 0u);
    EXPECT_EQ(mpu::upload::default_chunk_size(SizedFile(10000)), 1u);
    EXPECT_EQ(mpu::upload::default_chunk_size(SizedFile(10001)), 2u);
}

TEST(ChunkPlannerTest, ChunkSizeCallbackOnlyConsultedForMultipart) {
    SizedFile file(12 * kMiB);
    int calls = 0;
    auto get_chunk_size = [&calls](const FileHandle&) {
        ++calls;
        return 1 * kMiB;
    };

    mpu::upload::plan_chunks(file, false, get_chunk_size);
    EXPECT_EQ(calls, 0);

    mpu::upload::plan_chunks(file, true, get_chunk_size);
    EXPECT_EQ(calls, 1);
}

TEST(ChunkPlannerTest, PredicateIsEvaluatedOnce) {
    SizedFile file(12 * kMiB);
    int calls = 0;
    auto plan = mpu::upload::plan_chunks(file, predicate([&calls](const FileHandle& f) {
        ++calls;
        return f.size() > 10 * kMiB;
    }), nullptr);

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(plan.multipart);
    EXPECT_EQ(plan.chunks.size(), 3u);
}

TEST(ChunkPlannerTest, ThrowingPredicateIsConfigurationError) {
    SizedFile file(1);
    auto policy = predicate([](const FileHandle&) -> bool {
        throw std::runtime_error("no metadata");
    });

    EXPECT_THROW(mpu::upload::plan_chunks(file, policy, nullptr), ConfigurationError);
}

TEST(ChunkPlannerTest, EmptyPredicateIsConfigurationError) {
    SizedFile file(1);
    EXPECT_THROW(mpu::upload::resolve_multipart(predicate(nullptr), file), ConfigurationError);
}

TEST(ChunkPlannerTest, DataAccessorsAreLazyAndRepeatable) {
    SizedFile file(11 * kMiB);
    auto plan = mpu::upload::plan_chunks(file, true, nullptr);
    ASSERT_EQ(plan.chunks.size(), 3u);
    EXPECT_EQ(file.reads(), 0u);

    const auto first = plan.chunks[1].data();
    const auto second = plan.chunks[1].data();
    EXPECT_EQ(file.reads(), 0u);
    EXPECT_EQ(first.begin(), second.begin());
    EXPECT_EQ(first.end(), second.end());

    auto head = first.read(0, 4);
    ASSERT_TRUE(head.is_ok());
    EXPECT_EQ(file.reads(), 1u);
    const std::uint64_t offset = 5 * kMiB;
    EXPECT_EQ(head.value(), (std::vector<std::uint8_t>{
        static_cast<std::uint8_t>(offset % 251),
        static_cast<std::uint8_t>((offset + 1) % 251),
        static_cast<std::uint8_t>((offset + 2) % 251),
        static_cast<std::uint8_t>((offset + 3) % 251)}));
}
