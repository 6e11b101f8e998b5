#include "skyup/upload/partitioner.hpp"

#include <gtest/gtest.h>

using skyup::ErrorCode;
using skyup::upload::Part;
using skyup::upload::PartitionPlan;
using skyup::upload::split_into_chunk_aligned_parts;

TEST(PartitionerTest, WorkedExample) {
    auto plan = split_into_chunk_aligned_parts(150, 2, 100);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value(), (PartitionPlan{{0, 100}, {100, 150}}));
}

TEST(PartitionerTest, ChunksAreDealtRoundRobin) {
    auto plan = split_into_chunk_aligned_parts(500, 2, 100);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value(), (PartitionPlan{{0, 300}, {300, 500}}));
}

TEST(PartitionerTest, LeftoverGoesToPartAfterLastVisited) {
    // 2 full chunks over 3 parts: the leftover lands on part 2.
    auto plan = split_into_chunk_aligned_parts(250, 3, 100);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value(), (PartitionPlan{{0, 100}, {100, 200}, {200, 250}}));
}

TEST(PartitionerTest, LeftoverGoesToLastPartOnceAllVisited) {
    // 4 full chunks over 2 parts: plain round-robin would continue at part 0,
    // but the leftover index is min(fullChunks, partCount - 1) = 1.
    auto plan = split_into_chunk_aligned_parts(450, 2, 100);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value(), (PartitionPlan{{0, 200}, {200, 450}}));
}

TEST(PartitionerTest, SinglePartCoversEverything) {
    auto plan = split_into_chunk_aligned_parts(12345, 1, 100);
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value(), (PartitionPlan{{0, 12345}}));

    auto small = split_into_chunk_aligned_parts(50, 1, 100);
    ASSERT_TRUE(small.is_ok());
    EXPECT_EQ(small.value(), (PartitionPlan{{0, 50}}));
}

TEST(PartitionerTest, PartsAreContiguousAndSumToTotal) {
    const std::uint64_t chunk = 64;
    for (std::uint64_t total : {65u, 128u, 129u, 640u, 1000u, 4097u}) {
        for (std::int64_t parts = 1; parts <= 5; ++parts) {
            if (parts > 1 && total <= chunk) {
                continue;
            }
            auto plan = split_into_chunk_aligned_parts(total, parts, static_cast<std::int64_t>(chunk));
            ASSERT_TRUE(plan.is_ok()) << total << "/" << parts;
            ASSERT_EQ(plan.value().size(), static_cast<std::size_t>(parts));

            std::uint64_t expected_start = 0;
            int unaligned = 0;
            for (const Part& part : plan.value()) {
                EXPECT_EQ(part.start, expected_start);
                EXPECT_LE(part.start, part.end);
                if (part.length() % chunk != 0) {
                    ++unaligned;
                }
                expected_start = part.end;
            }
            EXPECT_EQ(expected_start, total);
            EXPECT_LE(unaligned, 1) << total << "/" << parts;
        }
    }
}

TEST(PartitionerTest, RejectsInvalidArguments) {
    auto no_parts = split_into_chunk_aligned_parts(1000, 0, 100);
    ASSERT_TRUE(no_parts.is_error());
    EXPECT_EQ(no_parts.error().code, ErrorCode::InvalidArgument);

    auto no_chunk = split_into_chunk_aligned_parts(1000, 2, 0);
    ASSERT_TRUE(no_chunk.is_error());
    EXPECT_EQ(no_chunk.error().code, ErrorCode::InvalidArgument);

    auto negative = split_into_chunk_aligned_parts(1000, -1, 100);
    ASSERT_TRUE(negative.is_error());
    EXPECT_EQ(negative.error().code, ErrorCode::InvalidArgument);
}

TEST(PartitionerTest, RejectsSeveralPartsForOneChunk) {
    auto equal = split_into_chunk_aligned_parts(100, 2, 100);
    ASSERT_TRUE(equal.is_error());
    EXPECT_EQ(equal.error().code, ErrorCode::InvalidArgument);

    auto smaller = split_into_chunk_aligned_parts(10, 3, 100);
    ASSERT_TRUE(smaller.is_error());
    EXPECT_EQ(smaller.error().code, ErrorCode::InvalidArgument);
}
