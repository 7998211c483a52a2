#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "model/PipelineErrors.hpp"
#include "validator/TimestampParser.hpp"

using namespace AisLake;

TEST(TimestampParserTest, ExtractsHourBucket)
{
    const auto key = TimestampParser::partition_key("2024-01-15T03:22:10");
    EXPECT_EQ(key, (PartitionKey{2024, 1, 15, 3}));
}

TEST(TimestampParserTest, ComputesEpochNanoseconds)
{
    // 2024-01-15T00:00:00Z = 1705276800
    const auto parsed = TimestampParser::parse("2024-01-15T03:22:10");
    EXPECT_EQ(parsed.epoch_ns, (1705276800LL + 3 * 3600 + 22 * 60 + 10) * 1'000'000'000LL);
}

TEST(TimestampParserTest, HourBoundaries)
{
    EXPECT_EQ(TimestampParser::partition_key("2024-01-15T23:59:59"), (PartitionKey{2024, 1, 15, 23}));
    EXPECT_EQ(TimestampParser::partition_key("2024-01-16T00:00:00"), (PartitionKey{2024, 1, 16, 0}));
    EXPECT_EQ(TimestampParser::partition_key("2023-12-31T23:00:00"), (PartitionKey{2023, 12, 31, 23}));
}

TEST(TimestampParserTest, SameInputSameKey)
{
    const std::string text = "2022-07-04T12:00:01";
    EXPECT_EQ(TimestampParser::parse(text).key, TimestampParser::parse(text).key);
    EXPECT_EQ(TimestampParser::parse(text).epoch_ns, TimestampParser::parse(text).epoch_ns);
}

TEST(TimestampParserTest, LeapDay)
{
    EXPECT_EQ(TimestampParser::partition_key("2024-02-29T10:00:00"), (PartitionKey{2024, 2, 29, 10}));
    EXPECT_THROW(TimestampParser::parse("2023-02-29T10:00:00"), MalformedTimestamp);
}

TEST(TimestampParserTest, RejectsMalformedText)
{
    const std::vector<std::string> bad = {
        "",
        "not-a-time",
        "2024-01-15 03:22:10",  // space instead of T
        "2024-01-15T03:22",     // no seconds
        "2024-01-15T03:22:10Z", // trailing zone designator
        "24-01-15T03:22:10",
        "2024-1-15T03:22:10",
        " 2024-01-15T03:22:10",
    };
    for (const auto &text : bad)
        EXPECT_THROW(TimestampParser::parse(text), MalformedTimestamp) << "input: '" << text << "'";
}

TEST(TimestampParserTest, RejectsOutOfRangeFields)
{
    const std::vector<std::string> bad = {
        "2024-13-01T00:00:00",
        "2024-00-10T00:00:00",
        "2024-04-31T00:00:00",
        "2024-01-15T24:00:00",
        "2024-01-15T03:60:00",
        "2024-01-15T03:22:60",
    };
    for (const auto &text : bad)
        EXPECT_THROW(TimestampParser::parse(text), MalformedTimestamp) << "input: '" << text << "'";
}

TEST(TimestampParserTest, ErrorCarriesOffendingText)
{
    try
    {
        (void)TimestampParser::parse("2024/01/15");
        FAIL() << "expected MalformedTimestamp";
    }
    catch (const MalformedTimestamp &e)
    {
        EXPECT_EQ(e.text(), "2024/01/15");
        const PipelineError &base = e;
        EXPECT_NE(std::string(base.what()).find("2024/01/15"), std::string::npos);
    }
}

TEST(PartitionKeyTest, ArtifactPathIsZeroPadded)
{
    const PartitionKey key{2024, 1, 5, 3};
    EXPECT_EQ(key.relative_artifact_path("AIS").generic_string(),
              "year=2024/month=01/day=05/hour=03/AIS_2024_01_05_processed_hour03.parquet");
    EXPECT_EQ(key.to_string(), "2024-01-05 hour 03");
}

TEST(PartitionKeyTest, OrdersChronologically)
{
    EXPECT_LT((PartitionKey{2024, 1, 1, 23}), (PartitionKey{2024, 1, 2, 0}));
    EXPECT_LT((PartitionKey{2023, 12, 31, 23}), (PartitionKey{2024, 1, 1, 0}));
}
