#include "PartitionMergeWriter.hpp"

#include <iterator>
#include <unordered_set>
#include "ParquetReader.hpp"
#include "ParquetWriter.hpp"
#include "../logging/Logger.hpp"
#include "../model/PipelineErrors.hpp"

namespace AisLake
{

    namespace
    {
        // Row identity for the opt-in dedup: one vessel reports at most one
        // position per second.
        std::string identity(const AisRecord &r)
        {
            std::string id = r.mmsi;
            id += '|';
            id += std::to_string(r.base_date_time);
            return id;
        }
    } // namespace

    PartitionMergeWriter::PartitionMergeWriter(std::filesystem::path output_root,
                                               std::string file_prefix,
                                               bool dedup_on_merge)
        : output_root_(std::move(output_root)),
          file_prefix_(std::move(file_prefix)),
          dedup_on_merge_(dedup_on_merge)
    {
    }

    std::filesystem::path PartitionMergeWriter::artifact_path(const PartitionKey &key) const
    {
        return output_root_ / key.relative_artifact_path(file_prefix_);
    }

    // =========================================================================
    // merge()
    // =========================================================================
    // Read whatever is already stored for the hour, append the new rows, and
    // rewrite the whole file.
    //
    // WHY REWRITE INSTEAD OF APPEND?
    // A Parquet file ends with its footer (schema + row group offsets). There
    // is no way to add a row group to a closed file without rewriting that
    // footer, and Arrow does not reopen a file for writing. An hourly file
    // holds at most a few hundred thousand AIS rows, so read + rewrite stays
    // cheap, and the tmp + rename in ParquetWriter keeps it atomic.
    //
    // WHY EXISTING ROWS FIRST?
    // Readers that page through a file see earlier runs' rows at the same
    // offsets after every merge. New rows only ever go on the end.
    // =========================================================================
    MergeResult PartitionMergeWriter::merge(const PartitionKey &key,
                                            std::vector<AisRecord> &&rows) const
    {
        MergeResult result;
        result.path = artifact_path(key);

        // ------------------------------------------------------------------
        // STEP 1: Existing artifact
        // ------------------------------------------------------------------
        std::vector<AisRecord> merged;
        std::error_code ec;
        if (std::filesystem::exists(result.path, ec))
        {
            try
            {
                merged = ParquetReader::read(result.path);
                result.existing_rows = merged.size();
                log_info("MERGE") << key.to_string() << ": " << result.existing_rows
                                  << " existing rows in " << result.path.filename();
            }
            catch (const ArtifactReadError &e)
            {
                log_warn("MERGE") << key.to_string() << ": existing artifact unreadable, "
                                  << "it will be replaced: " << e.what();
                merged.clear();
                result.replaced_unreadable = true;
            }
        }
        else if (ec)
        {
            // Could not even stat the path. Treat like an unreadable file;
            // the write below reports the real problem if there is one.
            log_warn("MERGE") << key.to_string() << ": cannot check " << result.path
                              << ": " << ec.message();
        }

        // ------------------------------------------------------------------
        // STEP 2: Optional identity dedup against what is already stored
        // ------------------------------------------------------------------
        if (dedup_on_merge_ && !merged.empty())
        {
            std::unordered_set<std::string> seen;
            seen.reserve(merged.size());
            for (const auto &r : merged)
                seen.insert(identity(r));

            const size_t before = rows.size();
            std::erase_if(rows, [&](const AisRecord &r)
                          { return seen.contains(identity(r)); });
            result.duplicates_dropped = before - rows.size();
        }

        // ------------------------------------------------------------------
        // STEP 3: existing ++ buffered, then rewrite
        // ------------------------------------------------------------------
        result.appended_rows = rows.size();
        if (result.appended_rows == 0 && result.existing_rows > 0)
        {
            // Everything was a duplicate: the stored file is already right.
            result.written_rows = result.existing_rows;
            log_info("MERGE") << key.to_string() << ": all " << result.duplicates_dropped
                              << " rows already stored, artifact left as is";
            return result;
        }

        if (merged.empty())
        {
            merged = std::move(rows);
        }
        else
        {
            merged.reserve(merged.size() + rows.size());
            merged.insert(merged.end(),
                          std::make_move_iterator(rows.begin()),
                          std::make_move_iterator(rows.end()));
        }
        result.written_rows = merged.size();

        // Release the moved-from buffer now rather than at end of task.
        std::vector<AisRecord>().swap(rows);

        const long long write_ns = ParquetWriter::write(merged, result.path);

        log_info("MERGE") << key.to_string() << ": wrote " << result.written_rows << " rows ("
                          << result.existing_rows << " existing + " << result.appended_rows << " new"
                          << (result.duplicates_dropped
                                  ? ", " + std::to_string(result.duplicates_dropped) + " duplicates dropped"
                                  : std::string())
                          << ") to " << result.path << " in " << write_ns / 1'000'000 << "ms";
        return result;
    }

} // namespace AisLake
