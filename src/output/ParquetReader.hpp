#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>
#include "../model/AisRecord.hpp"

namespace AisLake
{

    // Reads an existing partition artifact back into rows, for merge-on-write.
    //
    // Columns are located by name, not position, so artifacts written by
    // older tooling (pandas/pyarrow, which adds an index column and may store
    // BaseDateTime without a time zone or in another unit) still merge.
    // A column missing from the file reads as null; a missing or null-typed
    // BaseDateTime, or a column of an incompatible type, is an error.
    class ParquetReader
    {
    public:
        // Throws ArtifactReadError if the file cannot be opened, is not valid
        // Parquet, or does not carry a compatible schema.
        [[nodiscard]]
        static std::vector<AisRecord> read(const std::filesystem::path &path);

        // Row count from the footer only; no column data is decoded.
        [[nodiscard]]
        static int64_t row_count(const std::filesystem::path &path);
    };

} // namespace AisLake
