#pragma once

#include <compare>
#include <filesystem>
#include <iomanip>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include "AisRecord.hpp"

namespace AisLake
{

    // ============================================================================
    // PartitionKey: calendar-hour bucket (year, month, day, hour)
    // ============================================================================
    // Defaulted <=> compares members in declaration order, which is exactly
    // calendar order. That lets std::map keep partitions sorted by time, so
    // logs and summaries read chronologically.
    // ============================================================================
    struct PartitionKey
    {
        int year;
        int month;
        int day;
        int hour;

        auto operator<=>(const PartitionKey &) const = default;

        // "2024-01-15 hour 03"
        [[nodiscard]]
        std::string to_string() const
        {
            std::ostringstream oss;
            oss << std::setfill('0')
                << std::setw(4) << year << '-'
                << std::setw(2) << month << '-'
                << std::setw(2) << day << " hour "
                << std::setw(2) << hour;
            return oss.str();
        }

        // year=2024/month=01/day=15/hour=03/AIS_2024_01_15_processed_hour03.parquet
        //
        // Hive-style directory names: Athena, Spark and DuckDB all discover
        // year/month/day/hour as partition columns from the path alone, which
        // is why the artifact itself does not store them.
        [[nodiscard]]
        std::filesystem::path relative_artifact_path(std::string_view prefix) const
        {
            std::ostringstream dir;
            dir << std::setfill('0')
                << "year=" << std::setw(4) << year
                << "/month=" << std::setw(2) << month
                << "/day=" << std::setw(2) << day
                << "/hour=" << std::setw(2) << hour;

            std::ostringstream file;
            file << std::setfill('0')
                 << prefix << '_'
                 << std::setw(4) << year << '_'
                 << std::setw(2) << month << '_'
                 << std::setw(2) << day
                 << "_processed_hour" << std::setw(2) << hour
                 << ".parquet";

            return std::filesystem::path(dir.str()) / file.str();
        }
    };

    // Key -> rows for that key, in arrival order.
    using PartitionBufferMap = std::map<PartitionKey, std::vector<AisRecord>>;

} // namespace AisLake
