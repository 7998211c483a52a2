#pragma once

// ============================================================================
// ParquetWriter: vector<AisRecord> -> one Parquet artifact on disk
// ============================================================================
//
// Row layout in RAM (AisRecord):
//   [mmsi, ts, lat, lon, sog, ..., vessel_name, ...]
//   [mmsi, ts, lat, lon, sog, ..., vessel_name, ...]
//
// Columnar layout in the file:
//   MMSI:       [367..., 367..., 538..., ...]
//   LAT:        [29.7,   29.7,   30.1,   ...]
//   VesselName: dictionary {0:"EVER GIVEN", 1:"MAERSK ..."} + indices
//
// "SELECT COUNT(*) WHERE SOG > 20" reads only the SOG column chunk, and the
// per-page min/max statistics let the reader skip pages whose max < 20.
//
// FILE SETTINGS:
//   compression   Snappy (fast decode, the Spark/Athena default)
//   format        Parquet 2.6 (nanosecond timestamps survive as-is)
//   data pages    ~1 MiB
//   dictionary    on for every column except BaseDateTime/LAT/LON, which
//                 are near-unique per row and only grow a useless dictionary
//   statistics    on (min/max/null_count per page and per row group)
//
// CRASH SAFETY:
//   The table is written to "<path>.tmp" in the same directory and renamed
//   over <path> only after Close() succeeded. rename() within one directory
//   is atomic on POSIX, so a reader (or the next run) sees either the old
//   complete file or the new complete file, never a half-written one.
// ============================================================================

#include <filesystem>
#include <vector>
#include "../model/AisRecord.hpp"

namespace AisLake
{

    class ParquetWriter
    {
    public:
        static constexpr int64_t kDataPageSize = 1 << 20; // 1 MiB

        // ====================================================================
        // write()
        // ====================================================================
        // Creates parent directories, writes all rows, replaces output_path.
        //
        // RETURNS: duration in nanoseconds
        //
        // THROWS: ArtifactWriteError on any failure. The previous file at
        //         output_path (if any) is untouched and the temp file removed.
        //
        // THREAD SAFETY:
        //   Stateless. Safe from any thread as long as no two threads write
        //   the same output_path (the scheduler guarantees one task per key).
        // ====================================================================
        [[nodiscard]]
        static long long write(
            const std::vector<AisRecord> &rows,
            const std::filesystem::path &output_path);

        // "<output_path>.tmp"
        [[nodiscard]]
        static std::filesystem::path temp_path_for(const std::filesystem::path &output_path);
    };

} // namespace AisLake
