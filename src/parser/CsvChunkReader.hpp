#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../model/AisRecord.hpp"

namespace AisLake
{

    // Columns the reader knows how to place into an AisRecord.
    enum class AisColumn
    {
        Mmsi,
        BaseDateTime,
        Lat,
        Lon,
        Sog,
        Cog,
        Heading,
        VesselName,
        Imo,
        CallSign,
        VesselType,
        Status,
        Length,
        Width,
        Draft,
        Cargo,
        TransceiverClass,
        Ignored // present in the file, not part of the artifact schema
    };

    class CsvChunkReader
    {
    public:
        // Size of one read() from the file. Memory held by the reader is
        // one block plus whatever partial line straddles the block edge.
        static constexpr size_t kBlockSize = 1 << 20; // 1 MiB

        /**
         * @brief Opens the file and consumes the header line.
         * @throws SourceReadError if the file cannot be opened, is empty,
         *         or has no BaseDateTime column.
         */
        CsvChunkReader(const std::filesystem::path &file_path, size_t chunk_rows);

        /**
         * @brief Reads the next batch of at most chunk_rows rows.
         * @return std::nullopt once the input is exhausted.
         * @throws SourceReadError on I/O failure or an unparseable row.
         */
        [[nodiscard]]
        std::optional<RowBatch> next_batch();

        size_t rows_read() const { return rows_read_; }
        size_t batches_read() const { return batches_read_; }
        const std::filesystem::path &path() const { return path_; }

    private:
        bool next_line(std::string_view &line);
        void refill();
        void read_header();
        void split_fields(std::string_view line);
        SourceRow parse_row(std::string_view line);

        std::filesystem::path path_;
        std::ifstream file_;
        size_t chunk_rows_;

        std::string buffer_; // unconsumed bytes: [pos_, size())
        size_t pos_ = 0;
        bool eof_ = false;
        size_t line_number_ = 0;

        std::vector<AisColumn> layout_;   // CSV field index -> column
        std::vector<std::string> fields_; // reused for every row

        size_t rows_read_ = 0;
        size_t batches_read_ = 0;
    };

} // namespace AisLake
