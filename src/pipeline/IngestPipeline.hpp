#pragma once

// ============================================================================
// IngestPipeline: one CSV in, one hourly artifact per partition out
// ============================================================================
//
//   ┌──────────── producer (this thread) ─────────────┐   ┌─── consumers ───┐
//   CsvChunkReader ──batch──► PartitionAccumulator ──release──► Scheduler
//                                                              (ThreadPool)
//
// The two stages are strictly sequential: every batch of the file is read
// and grouped before the first partition task starts. That is what makes
// "one task per key per run" hold without any locking between stages.
//
// A producer error (unreadable file, bad header, malformed timestamp under
// the Abort policy) throws out of ingest_file() before anything is written.
// Consumer errors are per partition and end up in RunSummary::failed.
// ============================================================================

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "../benchmark/StageTimer.hpp"
#include "../config/PipelineConfig.hpp"
#include "../threading/PartitionTaskScheduler.hpp"

namespace AisLake
{

    class UploadVerifier;

    struct RunSummary
    {
        std::filesystem::path input;

        size_t rows_read = 0;          // data rows parsed from the CSV
        size_t rows_skipped = 0;       // malformed timestamps under Skip
        size_t rows_appended = 0;      // rows from this run now in artifacts
        size_t rows_in_artifacts = 0;  // total rows of the touched artifacts
        size_t duplicates_dropped = 0; // with --dedup only
        size_t batches = 0;

        size_t partitions_succeeded = 0;
        size_t partitions_failed = 0;
        std::vector<PartitionOutcome> failed; // key, stage, error

        std::vector<StageTiming> timings;

        bool fully_succeeded() const { return partitions_failed == 0; }
    };

    class IngestPipeline
    {
    public:
        // 'verifier' may be null (upload disabled). It must outlive the pipeline.
        IngestPipeline(const PipelineConfig &config, const UploadVerifier *verifier);

        /**
         * @brief Runs the full producer/consumer pipeline for one file.
         * Holds the output-tree lock for the duration of the run.
         * @throws SourceReadError, MalformedTimestamp, OutputTreeBusy,
         *         ArtifactWriteError (lock file)
         */
        [[nodiscard]]
        RunSummary ingest_file(const std::filesystem::path &csv_path) const;

    private:
        const PipelineConfig &config_;
        const UploadVerifier *verifier_;
    };

    // Multi-line human summary for the end of a run.
    [[nodiscard]]
    std::string format_run_summary(const RunSummary &summary);

} // namespace AisLake
