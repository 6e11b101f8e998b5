#include "skyup/transfer/coordinator.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <new>
#include <sstream>

using namespace skyup;
using namespace skyup::transfer;
using skyup::test_support::FakeResumableProtocol;
using skyup::test_support::FakeSingleRequest;
using std::chrono::milliseconds;

namespace {

const std::string kLarge = "abcdefghijklmnopqrst";  // 20 bytes, five 4-byte chunks
const std::string kSmall = "tiny";

// Scaled-down limits: 10-byte threshold, 4-byte chunks, two parts.
upload::UploadOptions small_limits() {
    auto options = upload::default_upload_options();
    options.large_file_size = 10;
    options.base_chunk_size = 4;
    options.num_parallel_uploads = 2;
    options.retry_delays = {milliseconds(0), milliseconds(0)};
    return options;
}

std::string bytes_of(const std::vector<std::uint8_t>& data) {
    return std::string(data.begin(), data.end());
}

std::vector<upload::ProgressEvent> drain(upload::ProgressChannel& channel) {
    std::vector<upload::ProgressEvent> events;
    while (auto event = channel.try_pop()) {
        events.push_back(std::move(*event));
    }
    return events;
}

class CoordinatorTest : public ::testing::Test {
protected:
    FakeResumableProtocol protocol;
    FakeSingleRequest single;
    ParallelUploadCoordinator coordinator{protocol, single};
};

} // namespace

TEST_F(CoordinatorTest, LargeUploadConcatenatesPartsInOrder) {
    upload::MemorySource source(kLarge);

    auto outcome = coordinator.upload(source, "notes.txt", small_limits());
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();
    EXPECT_EQ(outcome.value().skylink, protocol.skylink);
    EXPECT_EQ(outcome.value().uri, "sia://" + protocol.skylink);
    EXPECT_EQ(outcome.value().parts, 2u);
    EXPECT_EQ(outcome.value().bytes, kLarge.size());

    // Stagger holds part 1 back until part 0 is under way, so creation order
    // is deterministic: [0, 12) then [12, 20).
    ASSERT_EQ(protocol.uploads.size(), 3u);
    EXPECT_EQ(protocol.uploads[0].length, 12u);
    EXPECT_EQ(protocol.uploads[1].length, 8u);
    EXPECT_TRUE(protocol.uploads[0].partial);
    EXPECT_TRUE(protocol.uploads[1].partial);
    EXPECT_EQ(protocol.uploads[0].metadata.filename, "notes.txt");
    EXPECT_EQ(protocol.uploads[0].metadata.filetype, "text/plain");

    EXPECT_EQ(protocol.concatenated,
              (std::vector<std::string>{FakeResumableProtocol::location_of(0), FakeResumableProtocol::location_of(1)}));
    EXPECT_EQ(bytes_of(protocol.uploads[2].data), kLarge);
    EXPECT_EQ(protocol.probed, FakeResumableProtocol::location_of(2));
    EXPECT_EQ(single.calls, 0);
}

TEST_F(CoordinatorTest, SinglePartSkipsConcatenation) {
    upload::MemorySource source(kLarge);
    auto options = small_limits();
    options.num_parallel_uploads = 1;

    auto outcome = coordinator.upload(source, "video.mp4", options);
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().parts, 1u);
    EXPECT_EQ(protocol.concat_calls.load(), 0);
    ASSERT_EQ(protocol.uploads.size(), 1u);
    EXPECT_FALSE(protocol.uploads[0].partial);
    EXPECT_EQ(protocol.uploads[0].metadata.filetype, "video/mp4");
    EXPECT_EQ(protocol.probed, FakeResumableProtocol::location_of(0));
    EXPECT_EQ(protocol.patch_calls.load(), 5);
}

TEST_F(CoordinatorTest, ParallelismIsClampedToChunkCount) {
    upload::MemorySource source(std::string(12, 'x'));
    auto options = small_limits();
    options.num_parallel_uploads = 10;

    auto outcome = coordinator.upload(source, "x.bin", options);
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().parts, 3u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(protocol.uploads[i].length, 4u);
    }
}

TEST_F(CoordinatorTest, TransientFailureStillYieldsSameSkylink) {
    upload::MemorySource source(kLarge);
    protocol.patch_failures.push_back(transport_error("connection reset", true));

    auto outcome = coordinator.upload(source, "notes.txt", small_limits());
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();
    EXPECT_EQ(outcome.value().skylink, protocol.skylink);
    EXPECT_EQ(protocol.offset_calls.load(), 1);
    EXPECT_EQ(bytes_of(protocol.uploads.back().data), kLarge);
}

TEST_F(CoordinatorTest, ExhaustedRetriesFailWithoutFinalizing) {
    upload::MemorySource source(kLarge);
    for (int i = 0; i < 10; ++i) {
        protocol.patch_failures.push_back(transport_error("503 Service Unavailable", true));
    }

    auto outcome = coordinator.upload(source, "notes.txt", small_limits());
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().code, ErrorCode::TransportError);
    EXPECT_EQ(protocol.concat_calls.load(), 0);
    EXPECT_EQ(protocol.probe_calls.load(), 0);
}

TEST_F(CoordinatorTest, InvalidOptionsMakeNoRequests) {
    upload::MemorySource large(kLarge);
    upload::MemorySource small(kSmall);

    auto zero_multiplier = small_limits();
    zero_multiplier.chunk_size_multiplier = 0;
    auto zero_parallel = small_limits();
    zero_parallel.num_parallel_uploads = 0;

    for (const auto& options : {zero_multiplier, zero_parallel}) {
        for (const upload::ByteSource* source : {static_cast<const upload::ByteSource*>(&large),
                                                 static_cast<const upload::ByteSource*>(&small)}) {
            auto outcome = coordinator.upload(*source, "notes.txt", options);
            ASSERT_TRUE(outcome.is_error());
            EXPECT_EQ(outcome.error().code, ErrorCode::InvalidArgument);
        }
    }
    EXPECT_EQ(protocol.total_calls(), 0);
    EXPECT_EQ(single.calls, 0);
}

TEST_F(CoordinatorTest, ChunkCoveringWholePayloadCannotBeSplit) {
    upload::MemorySource source(kLarge);
    auto options = small_limits();
    options.chunk_size_multiplier = 5;  // one 20-byte chunk for two parts

    auto outcome = coordinator.upload(source, "notes.txt", options);
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(protocol.total_calls(), 0);
}

TEST_F(CoordinatorTest, CancelledBeforeStartMakesNoRequests) {
    upload::MemorySource source(kLarge);
    upload::UploadContext context;
    context.cancel = std::make_shared<CancellationToken>();
    context.cancel->cancel();

    auto outcome = coordinator.upload(source, "notes.txt", small_limits(), context);
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(protocol.total_calls(), 0);
}

TEST_F(CoordinatorTest, CancelDuringUploadStopsAllParts) {
    upload::MemorySource source(kLarge);
    upload::UploadContext context;
    context.cancel = std::make_shared<CancellationToken>();
    protocol.on_patch = [token = context.cancel](std::size_t, std::uint64_t) { token->cancel(); };

    auto outcome = coordinator.upload(source, "notes.txt", small_limits(), context);
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(protocol.concat_calls.load(), 0);
    EXPECT_EQ(protocol.probe_calls.load(), 0);
    EXPECT_LT(protocol.patch_calls.load(), 5);
}

TEST_F(CoordinatorTest, ThrowInsidePartFailsUploadAndReleasesOthers) {
    upload::MemorySource source(kLarge);
    upload::UploadContext context;
    context.progress = std::make_shared<upload::ProgressChannel>();
    // Part 1 waits on part 0's stagger gate; part 0 throws before reaching it.
    protocol.on_patch = [](std::size_t index, std::uint64_t) {
        if (index == 0) {
            throw std::bad_alloc();
        }
    };

    auto outcome = coordinator.upload(source, "notes.txt", small_limits(), context);
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().code, ErrorCode::UploadFailed);
    EXPECT_NE(outcome.error().message.find("Part 0"), std::string::npos);
    EXPECT_EQ(protocol.concat_calls.load(), 0);
    EXPECT_EQ(protocol.probe_calls.load(), 0);

    EXPECT_TRUE(context.progress->is_closed());
    const auto events = drain(*context.progress);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().kind, upload::ProgressKind::Failed);
}

TEST_F(CoordinatorTest, RequestsCarryTheCancellationToken) {
    upload::UploadContext context;
    context.cancel = std::make_shared<CancellationToken>();

    upload::MemorySource small(kSmall);
    ASSERT_TRUE(coordinator.upload(small, "tiny.txt", small_limits(), context).is_ok());
    EXPECT_EQ(single.received_token, context.cancel.get());

    upload::MemorySource large(kLarge);
    ASSERT_TRUE(coordinator.upload(large, "notes.txt", small_limits(), context).is_ok());
    EXPECT_GT(protocol.patch_calls.load(), 0);
    EXPECT_EQ(protocol.patches_with_token.load(), protocol.patch_calls.load());
}

TEST_F(CoordinatorTest, MissingSkylinkHeaderIsIncomplete) {
    upload::MemorySource source(kLarge);
    protocol.omit_skylink_header = true;

    auto outcome = coordinator.upload(source, "notes.txt", small_limits());
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().code, ErrorCode::UploadIncomplete);
}

TEST_F(CoordinatorTest, MalformedSkylinkHeaderIsRejected) {
    upload::MemorySource source(kLarge);
    protocol.skylink = "sia://not-a-skylink";

    auto outcome = coordinator.upload(source, "notes.txt", small_limits());
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().code, ErrorCode::MalformedSkylink);
}

TEST_F(CoordinatorTest, FullStaggerWaitsForFirstChunk) {
    upload::MemorySource source(kLarge);
    auto options = small_limits();
    options.stagger_percent = 100;

    std::mutex mutex;
    std::vector<std::pair<std::size_t, std::uint64_t>> patches;
    protocol.on_patch = [&](std::size_t index, std::uint64_t offset) {
        std::lock_guard lock(mutex);
        patches.emplace_back(index, offset);
    };

    ASSERT_TRUE(coordinator.upload(source, "notes.txt", options).is_ok());
    ASSERT_FALSE(patches.empty());
    EXPECT_EQ(patches.front(), (std::pair<std::size_t, std::uint64_t>{0, 0}));
    EXPECT_EQ(protocol.uploads[0].length, 12u);
}

TEST_F(CoordinatorTest, StaggerDisabledStillCompletes) {
    upload::MemorySource source(kLarge);
    auto options = small_limits();
    options.stagger_percent = std::nullopt;

    auto outcome = coordinator.upload(source, "notes.txt", options);
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(bytes_of(protocol.uploads.back().data), kLarge);
}

TEST_F(CoordinatorTest, SequentialSourceNeedsSinglePart) {
    std::istringstream parallel_stream(kLarge);
    upload::StreamSource parallel_source(parallel_stream, kLarge.size());

    auto rejected = coordinator.upload(parallel_source, "pipe", small_limits());
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(protocol.total_calls(), 0);

    std::istringstream serial_stream(kLarge);
    upload::StreamSource serial_source(serial_stream, kLarge.size());
    auto options = small_limits();
    options.num_parallel_uploads = 1;

    auto accepted = coordinator.upload(serial_source, "pipe", options);
    ASSERT_TRUE(accepted.is_ok());
    EXPECT_EQ(bytes_of(protocol.uploads[0].data), kLarge);
}

TEST_F(CoordinatorTest, SmallFileUsesSingleRequest) {
    upload::MemorySource source(kSmall);
    auto options = small_limits();
    options.dry_run = true;

    auto outcome = coordinator.upload(source, "tiny.txt", options);
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().skylink, single.response_skylink);
    EXPECT_EQ(outcome.value().parts, 0u);
    EXPECT_EQ(single.calls, 1);
    EXPECT_EQ(bytes_of(single.received), kSmall);
    EXPECT_EQ(single.received_filename, "tiny.txt");
    EXPECT_TRUE(single.dry_run);
    EXPECT_EQ(protocol.total_calls(), 0);
}

TEST_F(CoordinatorTest, SmallFileNormalizesPortalSkylink) {
    upload::MemorySource source(kSmall);
    single.response_skylink = "sia://" + test_support::make_skylink(0x33);

    auto outcome = coordinator.upload(source, "tiny.txt", small_limits());
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().skylink, test_support::make_skylink(0x33));

    single.response_skylink = "garbage";
    auto bad = coordinator.upload(source, "tiny.txt", small_limits());
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().code, ErrorCode::MalformedSkylink);
}

TEST_F(CoordinatorTest, PayloadAtThresholdTakesLargePath) {
    upload::MemorySource source(std::string(10, 'z'));

    auto outcome = coordinator.upload(source, "z.bin", small_limits());
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(single.calls, 0);
    EXPECT_GT(protocol.create_calls.load(), 0);
}

TEST_F(CoordinatorTest, ReportsProgressAndClosesChannel) {
    upload::MemorySource source(kLarge);
    upload::UploadContext context;
    context.progress = std::make_shared<upload::ProgressChannel>();

    auto outcome = coordinator.upload(source, "notes.txt", small_limits(), context);
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_TRUE(context.progress->is_closed());

    const auto events = drain(*context.progress);
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events.front().kind, upload::ProgressKind::Started);
    EXPECT_EQ(events.front().total_bytes, kLarge.size());
    EXPECT_EQ(events.back().kind, upload::ProgressKind::Completed);
    EXPECT_EQ(events.back().detail, protocol.skylink);

    std::uint64_t max_sent = 0;
    std::size_t finished_parts = 0;
    for (const auto& event : events) {
        if (event.kind == upload::ProgressKind::BytesSent) {
            EXPECT_LE(event.bytes_sent, kLarge.size());
            max_sent = std::max(max_sent, event.bytes_sent);
        }
        if (event.kind == upload::ProgressKind::PartCompleted) {
            ++finished_parts;
        }
    }
    EXPECT_EQ(max_sent, kLarge.size());
    EXPECT_EQ(finished_parts, 2u);
}

TEST_F(CoordinatorTest, FailureIsReportedOnChannel) {
    upload::MemorySource source(kSmall);
    single.failure = transport_error("portal rejected upload", false);
    upload::UploadContext context;
    context.progress = std::make_shared<upload::ProgressChannel>();

    auto outcome = coordinator.upload(source, "tiny.txt", small_limits(), context);
    ASSERT_TRUE(outcome.is_error());

    const auto events = drain(*context.progress);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().kind, upload::ProgressKind::Failed);
    EXPECT_NE(events.back().detail.find("portal rejected upload"), std::string::npos);
}
