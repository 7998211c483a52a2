#pragma once

// ============================================================================
// PartitionMergeWriter: merge-on-write for one partition artifact
// ============================================================================
//
//   existing artifact (may be absent)     this run's buffer
//   [e1 e2 ... eN]                        [b1 b2 ... bM]
//                \                       /
//                 ──► [e1 ... eN b1 ... bM] ──► ParquetWriter (tmp + rename)
//
// Repeated runs against the same tree ADD to an hour instead of replacing
// it. The price: feeding the same CSV twice doubles that hour's rows.
// The optional identity dedup (MMSI + BaseDateTime) exists for exactly that
// case and is off by default.
//
// An existing file that cannot be read is logged and replaced: the run
// keeps going and the hour ends up with this run's rows only.
// ============================================================================

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "../model/AisRecord.hpp"
#include "../model/PartitionKey.hpp"

namespace AisLake
{

    struct MergeResult
    {
        std::filesystem::path path;
        size_t existing_rows = 0;      // rows read back from the old artifact
        size_t appended_rows = 0;      // rows from this run's buffer kept
        size_t duplicates_dropped = 0; // buffer rows removed by dedup
        size_t written_rows = 0;       // existing_rows + appended_rows
        bool replaced_unreadable = false;
    };

    class PartitionMergeWriter
    {
    public:
        PartitionMergeWriter(std::filesystem::path output_root,
                             std::string file_prefix,
                             bool dedup_on_merge = false);

        // Deterministic location of the artifact for 'key'.
        [[nodiscard]]
        std::filesystem::path artifact_path(const PartitionKey &key) const;

        /**
         * @brief Merges 'rows' into the artifact for 'key' and rewrites it.
         * Takes the buffer by rvalue: ownership moves into the task.
         * @throws ArtifactWriteError if the new file cannot be written.
         */
        [[nodiscard]]
        MergeResult merge(const PartitionKey &key, std::vector<AisRecord> &&rows) const;

        const std::filesystem::path &output_root() const { return output_root_; }

    private:
        std::filesystem::path output_root_;
        std::string file_prefix_;
        bool dedup_on_merge_;
    };

} // namespace AisLake
