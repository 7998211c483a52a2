#include <gtest/gtest.h>
#include <memory>
#include <string>

#include "TestSupport.hpp"
#include "model/PipelineErrors.hpp"
#include "output/ParquetReader.hpp"
#include "output/PartitionMergeWriter.hpp"
#include "storage/UploadVerifier.hpp"
#include "threading/PartitionTaskScheduler.hpp"

using namespace AisLake;
using namespace AisLake::Testing;

namespace
{
    constexpr long long kDayStart = 1705276800; // 2024-01-15T00:00:00Z

    PartitionBufferMap hours(std::initializer_list<int> hour_list, size_t rows_per_hour)
    {
        PartitionBufferMap buffers;
        for (int h : hour_list)
        {
            auto &rows = buffers[PartitionKey{2024, 1, 15, h}];
            for (size_t i = 0; i < rows_per_hour; ++i)
                rows.push_back(make_record("v" + std::to_string(h) + "_" + std::to_string(i),
                                           kDayStart + h * 3600 + static_cast<long long>(i)));
        }
        return buffers;
    }
}

class PartitionTaskSchedulerTest : public ::testing::Test
{
protected:
    PartitionTaskSchedulerTest() : writer_(local_.path(), "AIS") {}

    std::unique_ptr<UploadVerifier> make_verifier()
    {
        std::filesystem::create_directories(remote_dir_ / "bucket");
        remote_ = std::make_shared<FlakyRemoteFs>(remote_dir_.path());
        return std::make_unique<UploadVerifier>(remote_, "bucket", local_.path());
    }

    std::filesystem::path remote_copy(const PartitionKey &key) const
    {
        return remote_dir_ / "bucket" / key.relative_artifact_path("AIS");
    }

    ScopedTempDir local_;
    ScopedTempDir remote_dir_;
    PartitionMergeWriter writer_;
    std::shared_ptr<FlakyRemoteFs> remote_;
};

TEST_F(PartitionTaskSchedulerTest, WritesEveryPartitionInParallel)
{
    PartitionTaskScheduler scheduler(writer_, nullptr, 4);
    const auto report = scheduler.run(hours({0, 1, 2, 3, 4, 5}, 10));

    EXPECT_EQ(report.succeeded, 6u);
    EXPECT_EQ(report.failed, 0u);
    ASSERT_EQ(report.outcomes.size(), 6u);
    for (int h = 0; h < 6; ++h)
    {
        const auto &outcome = report.outcomes[static_cast<size_t>(h)];
        EXPECT_EQ(outcome.key, (PartitionKey{2024, 1, 15, h}));
        EXPECT_TRUE(outcome.succeeded);
        EXPECT_EQ(outcome.written_rows, 10u);
        EXPECT_FALSE(outcome.uploaded);
        EXPECT_EQ(ParquetReader::row_count(writer_.artifact_path(outcome.key)), 10);
    }
}

TEST_F(PartitionTaskSchedulerTest, EmptyMapIsANoOp)
{
    PartitionTaskScheduler scheduler(writer_, nullptr, 2);
    const auto report = scheduler.run({});
    EXPECT_TRUE(report.outcomes.empty());
    EXPECT_EQ(report.succeeded + report.failed, 0u);
}

TEST_F(PartitionTaskSchedulerTest, OneUnwritablePartitionDoesNotStopTheOthers)
{
    // hour=02 cannot become a directory.
    write_text_file(local_ / "year=2024/month=01/day=15/hour=02", "blocker");

    PartitionTaskScheduler scheduler(writer_, nullptr, 3);
    const auto report = scheduler.run(hours({0, 1, 2, 3}, 5));

    EXPECT_EQ(report.succeeded, 3u);
    EXPECT_EQ(report.failed, 1u);

    const auto &failed = report.outcomes[2];
    EXPECT_EQ(failed.key, (PartitionKey{2024, 1, 15, 2}));
    EXPECT_FALSE(failed.succeeded);
    EXPECT_EQ(failed.failed_stage, "merge");
    EXPECT_FALSE(failed.error.empty());

    for (int h : {0, 1, 3})
        EXPECT_TRUE(std::filesystem::exists(writer_.artifact_path(PartitionKey{2024, 1, 15, h})));
}

TEST_F(PartitionTaskSchedulerTest, UploadsAndDeletesAfterVerification)
{
    auto verifier = make_verifier();
    PartitionTaskScheduler scheduler(writer_, verifier.get(), 2);
    const auto report = scheduler.run(hours({0, 1}, 3));

    ASSERT_EQ(report.succeeded, 2u);
    for (const auto &outcome : report.outcomes)
    {
        EXPECT_TRUE(outcome.uploaded);
        EXPECT_TRUE(outcome.local_deleted);
        EXPECT_FALSE(std::filesystem::exists(writer_.artifact_path(outcome.key)));
        EXPECT_EQ(ParquetReader::row_count(remote_copy(outcome.key)), 3);
    }
}

TEST_F(PartitionTaskSchedulerTest, ProbeFailureKeepsLocalArtifact)
{
    auto verifier = make_verifier();
    // Restore also probes; let it see "nothing there" so the merge runs,
    // then the post-upload probe cannot confirm the object.
    remote_->probe_fault = FlakyRemoteFs::ProbeFault::Missing;

    PartitionTaskScheduler scheduler(writer_, verifier.get(), 1);
    const auto report = scheduler.run(hours({7}, 4));

    ASSERT_EQ(report.failed, 1u);
    const auto &outcome = report.outcomes.front();
    EXPECT_EQ(outcome.failed_stage, "upload");
    EXPECT_EQ(outcome.written_rows, 4u);
    EXPECT_TRUE(std::filesystem::exists(writer_.artifact_path(outcome.key)));
}

TEST_F(PartitionTaskSchedulerTest, MergesWithRowsPreviouslyUploaded)
{
    auto verifier = make_verifier();
    PartitionTaskScheduler scheduler(writer_, verifier.get(), 2);

    const PartitionKey key{2024, 1, 15, 5};
    ASSERT_EQ(scheduler.run(hours({5}, 3)).succeeded, 1u);
    ASSERT_FALSE(std::filesystem::exists(writer_.artifact_path(key)));

    PartitionBufferMap second;
    second[key] = {make_record("late_1", kDayStart + 5 * 3600 + 100),
                   make_record("late_2", kDayStart + 5 * 3600 + 101)};
    const auto report = scheduler.run(std::move(second));

    ASSERT_EQ(report.succeeded, 1u);
    const auto &outcome = report.outcomes.front();
    EXPECT_TRUE(outcome.restored_from_remote);
    EXPECT_EQ(outcome.existing_rows, 3u);
    EXPECT_EQ(outcome.written_rows, 5u);

    const auto rows = ParquetReader::read(remote_copy(key));
    EXPECT_EQ(mmsis(rows), (std::vector<std::string>{"v5_0", "v5_1", "v5_2", "late_1", "late_2"}));
}

TEST_F(PartitionTaskSchedulerTest, UnreachableStoreFailsBeforeMerging)
{
    auto verifier = make_verifier();
    remote_->probe_fault = FlakyRemoteFs::ProbeFault::Error;

    PartitionTaskScheduler scheduler(writer_, verifier.get(), 1);
    const auto report = scheduler.run(hours({9}, 2));

    ASSERT_EQ(report.failed, 1u);
    EXPECT_EQ(report.outcomes.front().failed_stage, "restore");
    EXPECT_FALSE(std::filesystem::exists(writer_.artifact_path(PartitionKey{2024, 1, 15, 9})));
}

TEST_F(PartitionTaskSchedulerTest, UnstatableLocalPathFailsOnlyThatPartition)
{
    auto verifier = make_verifier();

    // hour=02 is a symlink to itself: stat() on anything below it is ELOOP.
    const auto day_dir = local_ / "year=2024/month=01/day=15";
    std::filesystem::create_directories(day_dir);
    std::filesystem::create_directory_symlink("hour=02", day_dir / "hour=02");

    PartitionTaskScheduler scheduler(writer_, verifier.get(), 2);
    const auto report = scheduler.run(hours({0, 1, 2, 3}, 4));

    EXPECT_EQ(report.succeeded, 3u);
    EXPECT_EQ(report.failed, 1u);
    ASSERT_EQ(report.outcomes.size(), 4u);

    const auto &failed = report.outcomes[2];
    EXPECT_EQ(failed.key, (PartitionKey{2024, 1, 15, 2}));
    EXPECT_EQ(failed.failed_stage, "restore");
    EXPECT_FALSE(failed.error.empty());

    for (int h : {0, 1, 3})
    {
        const PartitionKey key{2024, 1, 15, h};
        EXPECT_EQ(ParquetReader::row_count(remote_copy(key)), 4);
    }
}

TEST_F(PartitionTaskSchedulerTest, RejectsZeroWorkers)
{
    EXPECT_THROW(PartitionTaskScheduler(writer_, nullptr, 0), ConfigError);
}
