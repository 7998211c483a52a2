#pragma once

// ============================================================================
// Arrow schema of a partition artifact
// ============================================================================
// One definition shared by the writer (to build the table) and the reader
// (to reject files that do not match before touching any column).
// Column names are the NOAA CSV header names, so a Parquet artifact and its
// source CSV can be compared column by column.
//
// BaseDateTime is a real timestamp[ns, UTC]: Athena / DuckDB can filter on
// it directly and statistics min/max are meaningful instants.
// ============================================================================

#include <memory>
#include <arrow/api.h>

namespace AisLake
{

    namespace AisSchema
    {
        // Column indices in the table, in schema order.
        enum Column : int
        {
            kMmsi = 0,
            kBaseDateTime,
            kLat,
            kLon,
            kSog,
            kCog,
            kHeading,
            kVesselName,
            kImo,
            kCallSign,
            kVesselType,
            kStatus,
            kLength,
            kWidth,
            kDraft,
            kCargo,
            kTransceiverClass,
            kColumnCount
        };

        inline std::shared_ptr<arrow::DataType> timestamp_type()
        {
            return arrow::timestamp(arrow::TimeUnit::NANO, "UTC");
        }

        inline std::shared_ptr<arrow::Schema> schema()
        {
            return arrow::schema({
                arrow::field("MMSI", arrow::utf8()),
                arrow::field("BaseDateTime", timestamp_type(), /*nullable=*/false),
                arrow::field("LAT", arrow::float64()),
                arrow::field("LON", arrow::float64()),
                arrow::field("SOG", arrow::float64()),
                arrow::field("COG", arrow::float64()),
                arrow::field("Heading", arrow::float64()),
                arrow::field("VesselName", arrow::utf8()),
                arrow::field("IMO", arrow::utf8()),
                arrow::field("CallSign", arrow::utf8()),
                arrow::field("VesselType", arrow::int32()),
                arrow::field("Status", arrow::int32()),
                arrow::field("Length", arrow::float64()),
                arrow::field("Width", arrow::float64()),
                arrow::field("Draft", arrow::float64()),
                arrow::field("Cargo", arrow::utf8()),
                arrow::field("TransceiverClass", arrow::utf8()),
            });
        }
    } // namespace AisSchema

} // namespace AisLake
