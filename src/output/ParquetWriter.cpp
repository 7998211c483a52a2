#include "ParquetWriter.hpp"

#include <chrono>
#include <optional>
#include <system_error>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

#include "AisSchema.hpp"
#include "ArrowCheck.hpp"
#include "../logging/Logger.hpp"
#include "../model/PipelineErrors.hpp"

#define WRITE_CHECK(expr) AISLAKE_THROW_IF_NOT_OK(expr, ArtifactWriteError, "[PARQUET ERROR]")

namespace AisLake
{

    namespace
    {
        // Removes the temp file on every exit path unless commit() was called.
        class TempFileGuard
        {
        public:
            explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}

            ~TempFileGuard()
            {
                if (committed_)
                    return;
                std::error_code ec;
                std::filesystem::remove(path_, ec);
                if (ec)
                    log_warn("PARQUET") << "Could not remove temp file " << path_ << ": " << ec.message();
            }

            void commit() { committed_ = true; }

            TempFileGuard(const TempFileGuard &) = delete;
            TempFileGuard &operator=(const TempFileGuard &) = delete;

        private:
            std::filesystem::path path_;
            bool committed_ = false;
        };

        template <typename Builder, typename T>
        void append_optional(Builder &builder, const std::optional<T> &value)
        {
            if (value)
                WRITE_CHECK(builder.Append(*value));
            else
                WRITE_CHECK(builder.AppendNull());
        }

        // Empty text = null. Keeps "no vessel name" distinguishable from a
        // real value in SQL (IS NULL) the same way the CSV source meant it.
        void append_text(arrow::StringBuilder &builder, const std::string &value)
        {
            if (value.empty())
                WRITE_CHECK(builder.AppendNull());
            else
                WRITE_CHECK(builder.Append(std::string_view(value)));
        }

        template <typename Builder>
        std::shared_ptr<arrow::Array> finish(Builder &builder)
        {
            std::shared_ptr<arrow::Array> out;
            WRITE_CHECK(builder.Finish(&out));
            return out;
        }

        // ─────────────────────────────────────────────────────────────────
        // Row layout -> columnar layout
        // ─────────────────────────────────────────────────────────────────
        // One builder per column, filled in a single pass over the rows.
        // Fixed-width builders are reserved up front (one allocation each);
        // string builders grow on their own.
        // ─────────────────────────────────────────────────────────────────
        std::shared_ptr<arrow::Table> build_table(const std::vector<AisRecord> &rows)
        {
            auto *pool = arrow::default_memory_pool();
            const auto n = static_cast<int64_t>(rows.size());

            arrow::StringBuilder mmsi(pool);
            arrow::TimestampBuilder base_date_time(AisSchema::timestamp_type(), pool);
            arrow::DoubleBuilder lat(pool), lon(pool), sog(pool), cog(pool), heading(pool);
            arrow::StringBuilder vessel_name(pool), imo(pool), call_sign(pool);
            arrow::Int32Builder vessel_type(pool), status(pool);
            arrow::DoubleBuilder length(pool), width(pool), draft(pool);
            arrow::StringBuilder cargo(pool), transceiver_class(pool);

            WRITE_CHECK(base_date_time.Reserve(n));
            for (auto *b : {&lat, &lon, &sog, &cog, &heading, &length, &width, &draft})
                WRITE_CHECK(b->Reserve(n));
            WRITE_CHECK(vessel_type.Reserve(n));
            WRITE_CHECK(status.Reserve(n));

            for (const auto &r : rows)
            {
                append_text(mmsi, r.mmsi);
                base_date_time.UnsafeAppend(r.base_date_time);
                append_optional(lat, r.lat);
                append_optional(lon, r.lon);
                append_optional(sog, r.sog);
                append_optional(cog, r.cog);
                append_optional(heading, r.heading);
                append_text(vessel_name, r.vessel_name);
                append_text(imo, r.imo);
                append_text(call_sign, r.call_sign);
                append_optional(vessel_type, r.vessel_type);
                append_optional(status, r.status);
                append_optional(length, r.length);
                append_optional(width, r.width);
                append_optional(draft, r.draft);
                append_text(cargo, r.cargo);
                append_text(transceiver_class, r.transceiver_class);
            }

            // Order must match AisSchema::Column.
            std::vector<std::shared_ptr<arrow::Array>> columns = {
                finish(mmsi), finish(base_date_time),
                finish(lat), finish(lon), finish(sog), finish(cog), finish(heading),
                finish(vessel_name), finish(imo), finish(call_sign),
                finish(vessel_type), finish(status),
                finish(length), finish(width), finish(draft),
                finish(cargo), finish(transceiver_class)};

            return arrow::Table::Make(AisSchema::schema(), columns, n);
        }
    } // namespace

    std::filesystem::path ParquetWriter::temp_path_for(const std::filesystem::path &output_path)
    {
        std::filesystem::path tmp = output_path;
        tmp += ".tmp";
        return tmp;
    }

    long long ParquetWriter::write(
        const std::vector<AisRecord> &rows,
        const std::filesystem::path &output_path)
    {
        auto t0 = std::chrono::high_resolution_clock::now();

        // ─────────────────────────────────────────────────────────────────
        // STEP 1: Directory tree year=/month=/day=/hour=
        // ─────────────────────────────────────────────────────────────────
        std::error_code ec;
        std::filesystem::create_directories(output_path.parent_path(), ec);
        if (ec)
        {
            throw ArtifactWriteError("[PARQUET ERROR] Cannot create directory " +
                                     output_path.parent_path().string() + ": " + ec.message());
        }

        // ─────────────────────────────────────────────────────────────────
        // STEP 2: Columnar table
        // ─────────────────────────────────────────────────────────────────
        auto table = build_table(rows);

        // ─────────────────────────────────────────────────────────────────
        // STEP 3: Write to the temp path
        // ─────────────────────────────────────────────────────────────────
        const auto tmp_path = temp_path_for(output_path);
        TempFileGuard guard(tmp_path);

        auto outfile = value_or_throw<ArtifactWriteError>(
            arrow::io::FileOutputStream::Open(tmp_path.string()),
            "[PARQUET ERROR] Cannot create output file: " + tmp_path.string());

        auto writer_props = parquet::WriterProperties::Builder()
                                .compression(arrow::Compression::SNAPPY)
                                ->version(parquet::ParquetVersion::PARQUET_2_6)
                                ->data_pagesize(kDataPageSize)
                                ->enable_dictionary()
                                ->disable_dictionary("BaseDateTime")
                                ->disable_dictionary("LAT")
                                ->disable_dictionary("LON")
                                ->enable_statistics()
                                ->build();

        // store_schema(): the Arrow schema goes into the footer so readers
        // get timestamp[ns, UTC] back instead of a re-inferred type.
        auto arrow_props = parquet::ArrowWriterProperties::Builder()
                               .store_schema()
                               ->build();

        WRITE_CHECK(parquet::arrow::WriteTable(
            *table,
            arrow::default_memory_pool(),
            outfile,
            parquet::DEFAULT_MAX_ROW_GROUP_LENGTH,
            writer_props,
            arrow_props));

        // Close() writes the footer. Without it the file is unreadable.
        WRITE_CHECK(outfile->Close());

        // ─────────────────────────────────────────────────────────────────
        // STEP 4: Publish
        // ─────────────────────────────────────────────────────────────────
        std::filesystem::rename(tmp_path, output_path, ec);
        if (ec)
        {
            throw ArtifactWriteError("[PARQUET ERROR] Cannot move " + tmp_path.string() +
                                     " to " + output_path.string() + ": " + ec.message());
        }
        guard.commit();

        auto t1 = std::chrono::high_resolution_clock::now();
        long long ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();

        log_debug("PARQUET") << "Wrote " << rows.size() << " rows ("
                             << std::filesystem::file_size(output_path, ec) << " bytes) to "
                             << output_path << " in " << ns / 1'000'000 << "ms";
        return ns;
    }

} // namespace AisLake
