#include "ParquetReader.hpp"

#include <limits>
#include <string>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/exception.h>
#include <parquet/file_reader.h>
#include <parquet/metadata.h>

#include "ArrowCheck.hpp"
#include "../model/PipelineErrors.hpp"

#define READ_CHECK(expr) AISLAKE_THROW_IF_NOT_OK(expr, ArtifactReadError, "[PARQUET ERROR]")

namespace AisLake
{

    namespace
    {
        [[noreturn]] void incompatible(const std::filesystem::path &path, const char *column,
                                       const arrow::DataType &type)
        {
            throw ArtifactReadError("[PARQUET ERROR] " + path.string() + ": column " + column +
                                    " has incompatible type " + type.ToString());
        }

        // Calls fn(chunk, first_row_of_chunk) for every chunk of a column.
        template <typename Fn>
        void for_each_chunk(const arrow::ChunkedArray &column, Fn &&fn)
        {
            int64_t offset = 0;
            for (const auto &chunk : column.chunks())
            {
                fn(*chunk, offset);
                offset += chunk->length();
            }
        }

        template <typename ArrayType, typename Assign>
        void copy_values(const arrow::Array &chunk, int64_t offset, Assign &&assign)
        {
            const auto &typed = static_cast<const ArrayType &>(chunk);
            for (int64_t i = 0; i < typed.length(); ++i)
            {
                if (!typed.IsNull(i))
                    assign(offset + i, typed.Value(i));
            }
        }

        // ─────────────────────────────────────────────────────────────────
        // Per-type column readers
        // ─────────────────────────────────────────────────────────────────
        // Each one tolerates the column being absent or of Arrow type "null"
        // (pyarrow's type for an all-missing object column): the field
        // simply stays at its default (empty / nullopt).
        // ─────────────────────────────────────────────────────────────────
        void read_text(const arrow::Table &table, const std::filesystem::path &path,
                       const char *name, std::vector<AisRecord> &rows,
                       std::string AisRecord::*member)
        {
            auto column = table.GetColumnByName(name);
            if (!column)
                return;

            for_each_chunk(*column, [&](const arrow::Array &chunk, int64_t offset)
                           {
                auto assign = [&](int64_t row, std::string_view value)
                { rows[static_cast<size_t>(row)].*member = std::string(value); };

                switch (chunk.type_id())
                {
                case arrow::Type::NA:
                    return;
                case arrow::Type::STRING:
                    copy_values<arrow::StringArray>(chunk, offset, assign);
                    return;
                case arrow::Type::LARGE_STRING:
                    copy_values<arrow::LargeStringArray>(chunk, offset, assign);
                    return;
                default:
                    incompatible(path, name, *chunk.type());
                } });
        }

        void read_double(const arrow::Table &table, const std::filesystem::path &path,
                         const char *name, std::vector<AisRecord> &rows,
                         std::optional<double> AisRecord::*member)
        {
            auto column = table.GetColumnByName(name);
            if (!column)
                return;

            for_each_chunk(*column, [&](const arrow::Array &chunk, int64_t offset)
                           {
                auto assign = [&](int64_t row, double value)
                { rows[static_cast<size_t>(row)].*member = value; };

                switch (chunk.type_id())
                {
                case arrow::Type::NA:
                    return;
                case arrow::Type::DOUBLE:
                    copy_values<arrow::DoubleArray>(chunk, offset, assign);
                    return;
                case arrow::Type::FLOAT:
                    copy_values<arrow::FloatArray>(chunk, offset, assign);
                    return;
                default:
                    incompatible(path, name, *chunk.type());
                } });
        }

        void read_int32(const arrow::Table &table, const std::filesystem::path &path,
                        const char *name, std::vector<AisRecord> &rows,
                        std::optional<int32_t> AisRecord::*member)
        {
            auto column = table.GetColumnByName(name);
            if (!column)
                return;

            for_each_chunk(*column, [&](const arrow::Array &chunk, int64_t offset)
                           {
                switch (chunk.type_id())
                {
                case arrow::Type::NA:
                    return;
                case arrow::Type::INT32:
                    copy_values<arrow::Int32Array>(chunk, offset, [&](int64_t row, int32_t value)
                                                   { rows[static_cast<size_t>(row)].*member = value; });
                    return;
                case arrow::Type::INT64:
                    copy_values<arrow::Int64Array>(chunk, offset, [&](int64_t row, int64_t value)
                                                   {
                        if (value < std::numeric_limits<int32_t>::min() ||
                            value > std::numeric_limits<int32_t>::max())
                            incompatible(path, name, *chunk.type());
                        rows[static_cast<size_t>(row)].*member = static_cast<int32_t>(value); });
                    return;
                default:
                    incompatible(path, name, *chunk.type());
                } });
        }

        // BaseDateTime is mandatory. Any timestamp unit is accepted and
        // scaled to nanoseconds; pandas 2.x may have written microseconds.
        void read_timestamps(const arrow::Table &table, const std::filesystem::path &path,
                             std::vector<AisRecord> &rows)
        {
            auto column = table.GetColumnByName("BaseDateTime");
            if (!column)
                throw ArtifactReadError("[PARQUET ERROR] " + path.string() + ": no BaseDateTime column");
            if (column->type()->id() != arrow::Type::TIMESTAMP)
                incompatible(path, "BaseDateTime", *column->type());

            const auto &ts_type = static_cast<const arrow::TimestampType &>(*column->type());
            long long scale = 1;
            switch (ts_type.unit())
            {
            case arrow::TimeUnit::SECOND:
                scale = 1'000'000'000LL;
                break;
            case arrow::TimeUnit::MILLI:
                scale = 1'000'000LL;
                break;
            case arrow::TimeUnit::MICRO:
                scale = 1'000LL;
                break;
            case arrow::TimeUnit::NANO:
                scale = 1;
                break;
            }

            if (column->null_count() > 0)
                throw ArtifactReadError("[PARQUET ERROR] " + path.string() + ": null BaseDateTime values");

            for_each_chunk(*column, [&](const arrow::Array &chunk, int64_t offset)
                           { copy_values<arrow::TimestampArray>(chunk, offset, [&](int64_t row, int64_t value)
                                                                { rows[static_cast<size_t>(row)].base_date_time = value * scale; }); });
        }
    } // namespace

    std::vector<AisRecord> ParquetReader::read(const std::filesystem::path &path)
    {
        std::shared_ptr<arrow::Table> table;

        // The parquet:: layer reports some corruption by throwing
        // ParquetException instead of returning a Status.
        try
        {
            auto infile = value_or_throw<ArtifactReadError>(
                arrow::io::ReadableFile::Open(path.string()),
                "[PARQUET ERROR] Cannot open " + path.string());

            auto reader = value_or_throw<ArtifactReadError>(
                parquet::arrow::OpenFile(infile, arrow::default_memory_pool()),
                "[PARQUET ERROR] Not a Parquet file: " + path.string());

            READ_CHECK(reader->ReadTable(&table));
        }
        catch (const parquet::ParquetException &e)
        {
            throw ArtifactReadError("[PARQUET ERROR] " + path.string() + ": " + e.what());
        }

        std::vector<AisRecord> rows(static_cast<size_t>(table->num_rows()));

        read_text(*table, path, "MMSI", rows, &AisRecord::mmsi);
        read_timestamps(*table, path, rows);
        read_double(*table, path, "LAT", rows, &AisRecord::lat);
        read_double(*table, path, "LON", rows, &AisRecord::lon);
        read_double(*table, path, "SOG", rows, &AisRecord::sog);
        read_double(*table, path, "COG", rows, &AisRecord::cog);
        read_double(*table, path, "Heading", rows, &AisRecord::heading);
        read_text(*table, path, "VesselName", rows, &AisRecord::vessel_name);
        read_text(*table, path, "IMO", rows, &AisRecord::imo);
        read_text(*table, path, "CallSign", rows, &AisRecord::call_sign);
        read_int32(*table, path, "VesselType", rows, &AisRecord::vessel_type);
        read_int32(*table, path, "Status", rows, &AisRecord::status);
        read_double(*table, path, "Length", rows, &AisRecord::length);
        read_double(*table, path, "Width", rows, &AisRecord::width);
        read_double(*table, path, "Draft", rows, &AisRecord::draft);
        read_text(*table, path, "Cargo", rows, &AisRecord::cargo);
        read_text(*table, path, "TransceiverClass", rows, &AisRecord::transceiver_class);

        return rows;
    }

    int64_t ParquetReader::row_count(const std::filesystem::path &path)
    {
        try
        {
            auto reader = parquet::ParquetFileReader::OpenFile(path.string(), /*memory_map=*/false);
            return reader->metadata()->num_rows();
        }
        catch (const parquet::ParquetException &e)
        {
            throw ArtifactReadError("[PARQUET ERROR] " + path.string() + ": " + e.what());
        }
    }

} // namespace AisLake
