#include "TimestampParser.hpp"

#include <charconv>
#include <chrono>
#include <string>
#include <ctre.hpp>
#include "../model/PipelineErrors.hpp"

namespace AisLake
{

    namespace
    {
        // The regex already guarantees 2 or 4 ASCII digits, so from_chars
        // cannot fail here; the result is still checked rather than trusted.
        int to_int(std::string_view digits, std::string_view whole)
        {
            int value = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
            if (ec != std::errc{} || ptr != digits.data() + digits.size())
                throw MalformedTimestamp(std::string(whole));
            return value;
        }
    } // namespace

    ParsedTimestamp TimestampParser::parse(std::string_view text)
    {
        // ------------------------------------------------------------------
        // STEP 1: Shape
        // ------------------------------------------------------------------
        // ctre::match anchors at both ends: "2024-01-15T03:22:10Z" or a
        // trailing space is rejected, same as a strict strptime format.
        // Each (...) group is a capture; structured bindings unpack them.
        // ------------------------------------------------------------------
        auto [whole, y, mo, d, h, mi, s] =
            ctre::match<"([0-9]{4})-([0-9]{2})-([0-9]{2})T([0-9]{2}):([0-9]{2}):([0-9]{2})">(text);

        if (!whole)
            throw MalformedTimestamp(std::string(text));

        const int year = to_int(y.to_view(), text);
        const int month = to_int(mo.to_view(), text);
        const int day = to_int(d.to_view(), text);
        const int hour = to_int(h.to_view(), text);
        const int minute = to_int(mi.to_view(), text);
        const int second = to_int(s.to_view(), text);

        // ------------------------------------------------------------------
        // STEP 2: Calendar validity
        // ------------------------------------------------------------------
        // year_month_day::ok() knows month lengths and leap years,
        // so "2023-02-29" fails while "2024-02-29" passes.
        // ------------------------------------------------------------------
        const std::chrono::year_month_day ymd{
            std::chrono::year{year},
            std::chrono::month{static_cast<unsigned>(month)},
            std::chrono::day{static_cast<unsigned>(day)}};

        if (!ymd.ok() || hour > 23 || minute > 59 || second > 59)
            throw MalformedTimestamp(std::string(text));

        // ------------------------------------------------------------------
        // STEP 3: Epoch nanoseconds for the BaseDateTime column
        // ------------------------------------------------------------------
        const auto instant = std::chrono::sys_days{ymd} +
                             std::chrono::hours{hour} +
                             std::chrono::minutes{minute} +
                             std::chrono::seconds{second};

        const long long epoch_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                                       instant.time_since_epoch())
                                       .count();

        return ParsedTimestamp{PartitionKey{year, month, day, hour}, epoch_ns};
    }

} // namespace AisLake
