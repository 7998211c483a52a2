#pragma once

// ============================================================================
// PartitionAccumulator: groups batches by hour and grows per-hour buffers
// ============================================================================
//
//   batch 1: [h0 h0 h1 h0]   ──►  h0: [r1 r2 r4]        h1: [r3]
//   batch 2: [h1 h0]         ──►  h0: [r1 r2 r4 r6]     h1: [r3 r5]
//
// Grouping is stable: inside one key, rows keep file order, and a later
// batch is always appended after an earlier one. One key = one buffer.
//
// SINGLE-THREADED BY CONSTRUCTION:
// Only the producer (main) thread calls consume(). Buffers are not shared
// with anyone until release() moves the whole map out, at which point the
// accumulator is spent and refuses more input. No mutex is needed because
// no two threads ever see the same buffer.
// ============================================================================

#include <cstddef>
#include <string>
#include <vector>
#include "../model/AisRecord.hpp"
#include "../model/PartitionKey.hpp"

namespace AisLake
{

    enum class MalformedTimestampPolicy
    {
        Abort, // rethrow MalformedTimestamp, the run fails
        Skip   // drop the row, count it, keep going
    };

    class PartitionAccumulator
    {
    public:
        explicit PartitionAccumulator(MalformedTimestampPolicy policy = MalformedTimestampPolicy::Abort);

        // Takes the batch by rvalue: rows are moved into the buffers.
        // Throws MalformedTimestamp under the Abort policy.
        void consume(RowBatch &&batch);

        // Hands over every buffer. The accumulator cannot be used afterwards.
        [[nodiscard]]
        PartitionBufferMap release() &&;

        size_t batches_consumed() const { return batches_consumed_; }
        size_t rows_consumed() const { return rows_consumed_; }
        size_t rows_skipped() const { return rows_skipped_; }
        size_t partition_count() const { return buffers_.size(); }

        // Rows currently buffered for one key (0 if unseen). For logging/tests.
        size_t buffered_rows(const PartitionKey &key) const;

    private:
        MalformedTimestampPolicy policy_;
        PartitionBufferMap buffers_;
        bool released_ = false;

        size_t batches_consumed_ = 0;
        size_t rows_consumed_ = 0; // rows that made it into a buffer
        size_t rows_skipped_ = 0;
    };

} // namespace AisLake
