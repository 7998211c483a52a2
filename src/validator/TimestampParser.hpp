#pragma once

// ============================================================================
// TimestampParser: BaseDateTime text -> PartitionKey + epoch nanoseconds
// ============================================================================
// The NOAA feed writes timestamps as "2024-01-15T03:22:10". The shape is
// checked with CTRE (compile-time regex): the pattern is turned into a
// matcher by the compiler, so the per-row cost is a handful of character
// comparisons. The calendar check (Feb 30, month 13, hour 24...) is done
// with C++20 <chrono> civil-date types.
//
// Total and deterministic: every string either yields exactly one key or
// throws MalformedTimestamp. No locale, no time zone: the feed is UTC.
// ============================================================================

#include <string_view>
#include "../model/PartitionKey.hpp"

namespace AisLake
{

    struct ParsedTimestamp
    {
        PartitionKey key;
        long long epoch_ns; // Nanoseconds since 1970-01-01T00:00:00Z
    };

    class TimestampParser
    {
    public:
        // Throws MalformedTimestamp if 'text' is not a valid
        // YYYY-MM-DDTHH:MM:SS calendar instant.
        [[nodiscard]]
        static ParsedTimestamp parse(std::string_view text);

        // Convenience for callers that only need the bucket.
        [[nodiscard]]
        static PartitionKey partition_key(std::string_view text)
        {
            return parse(text).key;
        }
    };

} // namespace AisLake
