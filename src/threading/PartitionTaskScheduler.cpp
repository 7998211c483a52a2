#include "PartitionTaskScheduler.hpp"

#include <algorithm>
#include <filesystem>
#include <future>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "ThreadPool.hpp"
#include "../logging/Logger.hpp"
#include "../model/PipelineErrors.hpp"
#include "../output/PartitionMergeWriter.hpp"
#include "../storage/UploadVerifier.hpp"

namespace AisLake
{

    namespace
    {
        void record_failure(PartitionOutcome &outcome, const char *stage, const std::string &message)
        {
            outcome.succeeded = false;
            outcome.failed_stage = stage;
            outcome.error = message;
            log_error("TASK") << outcome.key.to_string() << " failed at " << stage
                              << ": " << message;
        }
    } // namespace

    PartitionTaskScheduler::PartitionTaskScheduler(const PartitionMergeWriter &writer,
                                                   const UploadVerifier *verifier,
                                                   size_t worker_count)
        : writer_(writer), verifier_(verifier), worker_count_(worker_count)
    {
        if (worker_count_ == 0)
            throw ConfigError("[SCHEDULER ERROR] worker count must be at least 1");
    }

    PartitionOutcome PartitionTaskScheduler::process(const PartitionKey &key,
                                                     std::vector<AisRecord> &&rows) const
    {
        PartitionOutcome outcome;
        outcome.key = key;

        const auto artifact = writer_.artifact_path(key);

        // ── restore ──────────────────────────────────────────────────────
        // A previous run may have uploaded this hour and deleted the local
        // copy. Pull it back so the merge below sees those rows. If the store
        // cannot be asked, do not merge: uploading a file without the remote
        // rows would overwrite them. A local path that cannot be stat'ed
        // (permissions, symlink loop) fails the same way.
        bool local_present = false;
        if (verifier_ != nullptr)
        {
            std::error_code ec;
            local_present = std::filesystem::exists(artifact, ec);
            if (ec)
            {
                record_failure(outcome, "restore",
                               "[RESTORE ERROR] Cannot stat " + artifact.string() + ": " + ec.message());
                return outcome;
            }
        }

        if (verifier_ != nullptr && !local_present)
        {
            try
            {
                outcome.restored_from_remote = verifier_->restore(artifact);
            }
            catch (const std::exception &e)
            {
                record_failure(outcome, "restore", e.what());
                return outcome;
            }
        }

        // ── merge ────────────────────────────────────────────────────────
        try
        {
            const MergeResult merged = writer_.merge(key, std::move(rows));
            outcome.existing_rows = merged.existing_rows;
            outcome.appended_rows = merged.appended_rows;
            outcome.written_rows = merged.written_rows;
            outcome.duplicates_dropped = merged.duplicates_dropped;
        }
        catch (const std::exception &e)
        {
            record_failure(outcome, "merge", e.what());
            return outcome;
        }

        // ── upload ───────────────────────────────────────────────────────
        if (verifier_ != nullptr)
        {
            try
            {
                const UploadResult uploaded = verifier_->upload(artifact);
                outcome.uploaded = true;
                outcome.local_deleted = uploaded.local_deleted;
            }
            catch (const std::exception &e)
            {
                // The merged artifact is intact locally; the next run with
                // upload enabled will merge into it and try again.
                record_failure(outcome, "upload", e.what());
                return outcome;
            }
        }

        outcome.succeeded = true;
        log_debug("TASK") << key.to_string() << " done";
        return outcome;
    }

    ScheduleReport PartitionTaskScheduler::run(PartitionBufferMap &&buffers) const
    {
        ScheduleReport report;
        if (buffers.empty())
            return report;

        const size_t threads = std::min(worker_count_, buffers.size());
        log_info("SCHEDULER") << "Dispatching " << buffers.size() << " partition(s) to "
                              << threads << " worker(s)";

        std::vector<PartitionKey> keys;
        std::vector<std::future<PartitionOutcome>> futures;
        keys.reserve(buffers.size());
        futures.reserve(buffers.size());
        {
            ThreadPool pool(threads);
            while (!buffers.empty())
            {
                auto node = buffers.extract(buffers.begin());
                keys.push_back(node.key());
                futures.push_back(pool.submit(
                    [this, key = node.key(), rows = std::move(node.mapped())]() mutable
                    {
                        return process(key, std::move(rows));
                    }));
            }
            pool.wait_idle();
        } // workers joined

        report.outcomes.reserve(futures.size());
        for (size_t i = 0; i < futures.size(); ++i)
        {
            // process() records its own stage failures. Anything that still
            // escapes is charged to that partition alone.
            try
            {
                report.outcomes.push_back(futures[i].get());
            }
            catch (const std::exception &e)
            {
                PartitionOutcome outcome;
                outcome.key = keys[i];
                record_failure(outcome, "task", e.what());
                report.outcomes.push_back(std::move(outcome));
            }
        }

        std::sort(report.outcomes.begin(), report.outcomes.end(),
                  [](const PartitionOutcome &a, const PartitionOutcome &b)
                  { return a.key < b.key; });

        for (const auto &outcome : report.outcomes)
        {
            if (outcome.succeeded)
                ++report.succeeded;
            else
                ++report.failed;
        }

        log_info("SCHEDULER") << report.succeeded << " partition(s) succeeded, "
                              << report.failed << " failed";
        return report;
    }

} // namespace AisLake
