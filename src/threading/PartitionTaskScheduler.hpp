#pragma once

// ============================================================================
// PartitionTaskScheduler: one task per partition, failures kept per task
// ============================================================================
//
//   PartitionBufferMap ──move──► task(key, rows) ──► ThreadPool
//                                   │
//                                   ├─ restore  (upload on, no local file)
//                                   ├─ merge    (PartitionMergeWriter)
//                                   └─ upload   (UploadVerifier)
//
// Each task owns its buffer outright: the node is extracted from the map and
// moved into the task's closure, so no two threads ever share a buffer.
//
// A failing task records the key, the stage and the message in its outcome
// and returns normally. Its siblings never see the exception, and run()
// only returns after every task has settled.
// ============================================================================

#include <cstddef>
#include <string>
#include <vector>
#include "../model/PartitionKey.hpp"

namespace AisLake
{

    class PartitionMergeWriter;
    class UploadVerifier;

    struct PartitionOutcome
    {
        PartitionKey key{};
        bool succeeded = false;
        std::string failed_stage; // "restore", "merge", "upload" or "task"; empty on success
        std::string error;

        size_t existing_rows = 0;
        size_t appended_rows = 0;
        size_t written_rows = 0;
        size_t duplicates_dropped = 0;
        bool restored_from_remote = false;
        bool uploaded = false;
        bool local_deleted = false;
    };

    struct ScheduleReport
    {
        std::vector<PartitionOutcome> outcomes; // sorted by key
        size_t succeeded = 0;
        size_t failed = 0;
    };

    class PartitionTaskScheduler
    {
    public:
        // 'verifier' may be null: local-only mode, no restore and no upload.
        PartitionTaskScheduler(const PartitionMergeWriter &writer,
                               const UploadVerifier *verifier,
                               size_t worker_count);

        [[nodiscard]]
        ScheduleReport run(PartitionBufferMap &&buffers) const;

        // One partition, synchronously. run() calls this from pool workers.
        [[nodiscard]]
        PartitionOutcome process(const PartitionKey &key, std::vector<AisRecord> &&rows) const;

    private:
        const PartitionMergeWriter &writer_;
        const UploadVerifier *verifier_;
        size_t worker_count_;
    };

} // namespace AisLake
