#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace AisLake
{

    /**
     * @brief One AIS position report, as stored in a partition artifact.
     *
     * Field order follows the NOAA AIS CSV layout. Everything except the
     * timestamp may be missing in the source feed, so numeric fields are
     * optional and text fields use the empty string for "no value".
     * The partition columns (year/month/day/hour) are NOT part of the record:
     * they are implied by the artifact path.
     */
    struct AisRecord
    {
        // --- Identity ---
        std::string mmsi;         // Maritime Mobile Service Identity (9 chars)
        long long base_date_time; // Nanoseconds since Epoch (UTC)

        // --- Kinematics ---
        std::optional<double> lat;
        std::optional<double> lon;
        std::optional<double> sog;     // Speed over ground, knots
        std::optional<double> cog;     // Course over ground, degrees
        std::optional<double> heading; // True heading, degrees

        // --- Static / voyage data ---
        std::string vessel_name;
        std::string imo;
        std::string call_sign;
        std::optional<int32_t> vessel_type;
        std::optional<int32_t> status; // Navigational status code
        std::optional<double> length;
        std::optional<double> width;
        std::optional<double> draft;
        std::string cargo;
        std::string transceiver_class; // "A" or "B"

        bool operator==(const AisRecord &) const = default;
    };

    // A bounded slice of the input, in file order.
    // The raw timestamp text travels with the row so the key extractor
    // (not the CSV reader) decides what a malformed timestamp means.
    struct SourceRow
    {
        std::string timestamp_text;
        size_t line_number; // 1-based line in the source file
        AisRecord record;
    };

    using RowBatch = std::vector<SourceRow>;

} // namespace AisLake
