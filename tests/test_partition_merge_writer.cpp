#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "model/PipelineErrors.hpp"
#include "output/ParquetReader.hpp"
#include "output/PartitionMergeWriter.hpp"

using namespace AisLake;
using namespace AisLake::Testing;

namespace
{
    const PartitionKey kKey{2024, 1, 15, 3};
    constexpr long long kHourStart = 1705287600; // 2024-01-15T03:00:00Z
}

class PartitionMergeWriterTest : public ::testing::Test
{
protected:
    ScopedTempDir dir_;
};

TEST_F(PartitionMergeWriterTest, ArtifactPathLayout)
{
    PartitionMergeWriter writer(dir_.path(), "AIS");
    EXPECT_EQ(writer.artifact_path(kKey).string(),
              (dir_ / "year=2024/month=01/day=15/hour=03/AIS_2024_01_15_processed_hour03.parquet").string());

    PartitionMergeWriter custom(dir_.path(), "GULF");
    EXPECT_EQ(custom.artifact_path(kKey).filename().string(), "GULF_2024_01_15_processed_hour03.parquet");
}

TEST_F(PartitionMergeWriterTest, FirstWriteCreatesArtifact)
{
    PartitionMergeWriter writer(dir_.path(), "AIS");
    const auto result = writer.merge(kKey, {make_record("a", kHourStart), make_record("b", kHourStart + 1)});

    EXPECT_EQ(result.existing_rows, 0u);
    EXPECT_EQ(result.appended_rows, 2u);
    EXPECT_EQ(result.written_rows, 2u);
    EXPECT_FALSE(result.replaced_unreadable);
    EXPECT_EQ(mmsis(ParquetReader::read(result.path)), (std::vector<std::string>{"a", "b"}));
}

TEST_F(PartitionMergeWriterTest, SecondRunAppendsAfterExistingRows)
{
    PartitionMergeWriter writer(dir_.path(), "AIS");
    (void)writer.merge(kKey, {make_record("a", kHourStart), make_record("b", kHourStart + 1)});
    const auto result = writer.merge(kKey, {make_record("c", kHourStart + 2), make_record("d", kHourStart + 3),
                                            make_record("e", kHourStart + 4)});

    EXPECT_EQ(result.existing_rows, 2u);
    EXPECT_EQ(result.appended_rows, 3u);
    EXPECT_EQ(result.written_rows, 5u);
    EXPECT_EQ(mmsis(ParquetReader::read(result.path)), (std::vector<std::string>{"a", "b", "c", "d", "e"}));
}

TEST_F(PartitionMergeWriterTest, DuplicatesKeptByDefault)
{
    PartitionMergeWriter writer(dir_.path(), "AIS");
    (void)writer.merge(kKey, {make_record("a", kHourStart)});
    const auto result = writer.merge(kKey, {make_record("a", kHourStart)});

    EXPECT_EQ(result.duplicates_dropped, 0u);
    EXPECT_EQ(result.written_rows, 2u);
}

TEST_F(PartitionMergeWriterTest, DedupDropsRowsAlreadyStored)
{
    PartitionMergeWriter writer(dir_.path(), "AIS", /*dedup_on_merge=*/true);
    (void)writer.merge(kKey, {make_record("a", kHourStart), make_record("b", kHourStart + 5)});

    const auto result = writer.merge(kKey, {make_record("a", kHourStart),      // same identity
                                            make_record("a", kHourStart + 1),  // same vessel, later
                                            make_record("c", kHourStart + 5)}); // same time, other vessel

    EXPECT_EQ(result.duplicates_dropped, 1u);
    EXPECT_EQ(result.appended_rows, 2u);
    EXPECT_EQ(result.written_rows, 4u);
    EXPECT_EQ(mmsis(ParquetReader::read(result.path)), (std::vector<std::string>{"a", "b", "a", "c"}));
}

TEST_F(PartitionMergeWriterTest, DedupOfOnlyDuplicatesLeavesFileAlone)
{
    PartitionMergeWriter writer(dir_.path(), "AIS", /*dedup_on_merge=*/true);
    const auto first = writer.merge(kKey, {make_record("a", kHourStart)});
    const auto before = std::filesystem::last_write_time(first.path);

    const auto result = writer.merge(kKey, {make_record("a", kHourStart)});
    EXPECT_EQ(result.duplicates_dropped, 1u);
    EXPECT_EQ(result.appended_rows, 0u);
    EXPECT_EQ(result.written_rows, 1u);
    EXPECT_TRUE(std::filesystem::last_write_time(result.path) == before);
}

TEST_F(PartitionMergeWriterTest, UnreadableExistingArtifactIsReplaced)
{
    PartitionMergeWriter writer(dir_.path(), "AIS");
    write_text_file(writer.artifact_path(kKey), "corrupt bytes");

    const auto result = writer.merge(kKey, {make_record("x", kHourStart)});
    EXPECT_TRUE(result.replaced_unreadable);
    EXPECT_EQ(result.existing_rows, 0u);
    EXPECT_EQ(result.written_rows, 1u);
    EXPECT_EQ(mmsis(ParquetReader::read(result.path)), (std::vector<std::string>{"x"}));
}

TEST_F(PartitionMergeWriterTest, WriteFailureThrowsAndLeavesNothingBehind)
{
    PartitionMergeWriter writer(dir_.path(), "AIS");
    // The hour directory is a regular file, so it cannot be created.
    write_text_file(dir_ / "year=2024/month=01/day=15/hour=03", "blocker");

    EXPECT_THROW((void)writer.merge(kKey, {make_record("x", kHourStart)}), ArtifactWriteError);
    EXPECT_TRUE(std::filesystem::is_regular_file(dir_ / "year=2024/month=01/day=15/hour=03"));
}
