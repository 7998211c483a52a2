#include "IngestPipeline.hpp"

#include <sstream>
#include <utility>

#include "PartitionAccumulator.hpp"
#include "../logging/Logger.hpp"
#include "../output/PartitionMergeWriter.hpp"
#include "../parser/CsvChunkReader.hpp"
#include "../storage/OutputTreeLock.hpp"

namespace AisLake
{

    IngestPipeline::IngestPipeline(const PipelineConfig &config, const UploadVerifier *verifier)
        : config_(config), verifier_(verifier)
    {
    }

    RunSummary IngestPipeline::ingest_file(const std::filesystem::path &csv_path) const
    {
        RunSummary summary;
        summary.input = csv_path;

        // Held until the function returns, on success or on throw.
        OutputTreeLock lock(config_.output_root);

        log_info("PIPELINE") << "Ingesting " << csv_path << " into " << config_.output_root
                             << (verifier_ ? " (upload on)" : " (local only)");

        // ------------------------------------------------------------------
        // PRODUCER: read every batch and group it by hour
        // ------------------------------------------------------------------
        PartitionAccumulator accumulator(config_.skip_malformed ? MalformedTimestampPolicy::Skip
                                                                : MalformedTimestampPolicy::Abort);
        {
            StageTimer timer("Read+Group", summary.timings);

            CsvChunkReader reader(csv_path, config_.chunk_rows);
            while (auto batch = reader.next_batch())
                accumulator.consume(std::move(*batch));

            summary.rows_read = reader.rows_read();
            summary.batches = reader.batches_read();
            summary.rows_skipped = accumulator.rows_skipped();
            timer.set_item_count(summary.rows_read);
        }

        log_info("PIPELINE") << summary.rows_read << " rows in " << summary.batches
                             << " batch(es) grouped into " << accumulator.partition_count()
                             << " partition(s)";

        // ------------------------------------------------------------------
        // CONSUMERS: one merge(+upload) task per partition
        // ------------------------------------------------------------------
        PartitionMergeWriter writer(config_.output_root, config_.file_prefix, config_.dedup_on_merge);
        PartitionTaskScheduler scheduler(writer, verifier_, config_.worker_count);

        ScheduleReport report;
        {
            StageTimer timer(verifier_ ? "Merge+Upload" : "Merge", summary.timings);
            report = scheduler.run(std::move(accumulator).release());

            size_t handled = 0;
            for (const auto &outcome : report.outcomes)
                handled += outcome.appended_rows;
            timer.set_item_count(handled);
        }

        summary.partitions_succeeded = report.succeeded;
        summary.partitions_failed = report.failed;
        for (auto &outcome : report.outcomes)
        {
            summary.rows_appended += outcome.appended_rows;
            summary.rows_in_artifacts += outcome.written_rows;
            summary.duplicates_dropped += outcome.duplicates_dropped;
            if (!outcome.succeeded)
                summary.failed.push_back(std::move(outcome));
        }

        // Every row read is either skipped, dropped as a duplicate, appended,
        // or sits in a failed partition. Only in a clean run must they add up.
        const size_t expected = summary.rows_read - summary.rows_skipped - summary.duplicates_dropped;
        if (summary.fully_succeeded() && expected != summary.rows_appended)
        {
            log_warn("PIPELINE") << "Row count mismatch: read " << summary.rows_read
                                 << ", skipped " << summary.rows_skipped
                                 << ", duplicates " << summary.duplicates_dropped
                                 << ", appended " << summary.rows_appended;
        }

        log_info("PIPELINE") << "Total rows processed: " << summary.rows_read
                             << ", total rows appended: " << summary.rows_appended;
        return summary;
    }

    std::string format_run_summary(const RunSummary &summary)
    {
        std::ostringstream oss;
        oss << "Run summary for " << summary.input.string() << "\n"
            << "  rows read           : " << summary.rows_read << "\n"
            << "  rows skipped        : " << summary.rows_skipped << "\n"
            << "  duplicates dropped  : " << summary.duplicates_dropped << "\n"
            << "  rows appended       : " << summary.rows_appended << "\n"
            << "  rows in artifacts   : " << summary.rows_in_artifacts << "\n"
            << "  partitions ok/failed: " << summary.partitions_succeeded << " / "
            << summary.partitions_failed << "\n";

        for (const auto &f : summary.failed)
        {
            oss << "  FAILED " << f.key.to_string() << " [" << f.failed_stage << "] "
                << f.error << "\n";
        }

        if (!summary.timings.empty())
            oss << format_stage_report(summary.timings);
        return oss.str();
    }

} // namespace AisLake
