#include "PartitionAccumulator.hpp"

#include <iterator>
#include <stdexcept>
#include "../logging/Logger.hpp"
#include "../model/PipelineErrors.hpp"
#include "../validator/TimestampParser.hpp"

namespace AisLake
{

    namespace
    {
        // Only the first few skipped rows are logged individually; a corrupt
        // file could otherwise produce millions of warning lines.
        constexpr size_t kMaxSkipWarnings = 10;
    } // namespace

    PartitionAccumulator::PartitionAccumulator(MalformedTimestampPolicy policy)
        : policy_(policy)
    {
    }

    // =========================================================================
    // consume()
    // =========================================================================
    // Group the batch into its own map, then splice that map onto buffers_.
    //
    // WHY NOT APPEND STRAIGHT INTO buffers_?
    // Under the Abort policy one malformed timestamp rejects the whole input,
    // and the caller may still inspect what was buffered before it. The throw
    // happens while only the local map holds rows from this batch.
    // =========================================================================
    void PartitionAccumulator::consume(RowBatch &&batch)
    {
        if (released_)
            throw std::logic_error("PartitionAccumulator::consume called after release()");

        // ------------------------------------------------------------------
        // STEP 1: Group this batch on its own
        // ------------------------------------------------------------------
        // Grouping into a local map first (instead of appending straight into
        // buffers_) means a MalformedTimestamp under the Abort policy leaves
        // buffers_ exactly as it was after the previous batch.
        // ------------------------------------------------------------------
        PartitionBufferMap grouped;
        size_t skipped_here = 0;

        for (auto &row : batch)
        {
            ParsedTimestamp ts{};
            try
            {
                ts = TimestampParser::parse(row.timestamp_text);
            }
            catch (const MalformedTimestamp &e)
            {
                if (policy_ == MalformedTimestampPolicy::Abort)
                {
                    log_error("ACCUMULATOR") << "Line " << row.line_number << ": " << e.what();
                    throw;
                }
                ++skipped_here;
                if (rows_skipped_ + skipped_here <= kMaxSkipWarnings)
                {
                    log_warn("ACCUMULATOR") << "Skipping line " << row.line_number
                                            << ": bad BaseDateTime '" << e.text() << "'";
                }
                continue;
            }

            row.record.base_date_time = ts.epoch_ns;
            grouped[ts.key].push_back(std::move(row.record));
        }

        // ------------------------------------------------------------------
        // STEP 2: Append each group to the run-wide buffer for its key
        // ------------------------------------------------------------------
        // First sighting of a key: move the whole vector in (no copy).
        // Otherwise: move-append after the rows from earlier batches.
        // ------------------------------------------------------------------
        size_t accepted = 0;
        for (auto &[key, rows] : grouped)
        {
            accepted += rows.size();
            auto [it, inserted] = buffers_.try_emplace(key);
            if (inserted)
            {
                it->second = std::move(rows);
                continue;
            }
            it->second.insert(it->second.end(),
                              std::make_move_iterator(rows.begin()),
                              std::make_move_iterator(rows.end()));
        }

        ++batches_consumed_;
        rows_consumed_ += accepted;
        rows_skipped_ += skipped_here;

        log_info("ACCUMULATOR") << "Batch " << batches_consumed_ << ": "
                                << accepted << " rows into " << grouped.size()
                                << " partitions (" << buffers_.size() << " open, "
                                << rows_consumed_ << " rows buffered"
                                << (skipped_here ? ", " + std::to_string(skipped_here) + " skipped" : std::string())
                                << ")";
    }

    PartitionBufferMap PartitionAccumulator::release() &&
    {
        if (released_)
            throw std::logic_error("PartitionAccumulator::release called twice");
        released_ = true;

        for (const auto &[key, rows] : buffers_)
            log_debug("ACCUMULATOR") << key.to_string() << ": " << rows.size() << " rows";

        PartitionBufferMap out = std::move(buffers_);
        buffers_.clear();
        return out;
    }

    size_t PartitionAccumulator::buffered_rows(const PartitionKey &key) const
    {
        auto it = buffers_.find(key);
        return it == buffers_.end() ? 0 : it->second.size();
    }

} // namespace AisLake
