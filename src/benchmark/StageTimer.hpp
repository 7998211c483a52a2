#pragma once

// ============================================================================
// StageTimer: RAII wall-clock timing of a pipeline stage
// ============================================================================
//
//   {
//       StageTimer t("Read+Group", timings);
//       ... work ...
//       t.set_item_count(rows);   // known only once the stage is done
//   }                             // ← duration recorded here
//
// The row count is usually not known up front (the reader discovers it), so
// it can be set at any point before the timer goes out of scope.
// ============================================================================

#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace AisLake
{

    struct StageTiming
    {
        std::string label;
        long long duration_ns = 0;
        size_t item_count = 0;

        double duration_ms() const
        {
            return static_cast<double>(duration_ns) / 1'000'000.0;
        }

        double items_per_second() const
        {
            if (duration_ns == 0)
                return 0.0;
            return static_cast<double>(item_count) * 1'000'000'000.0 / static_cast<double>(duration_ns);
        }
    };

    class StageTimer
    {
    public:
        using Clock = std::chrono::steady_clock;

        StageTimer(std::string label, std::vector<StageTiming> &out)
            : label_(std::move(label)), out_(out), start_(Clock::now())
        {
        }

        ~StageTimer()
        {
            const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start_);
            out_.push_back({label_, elapsed.count(), item_count_});
        }

        void set_item_count(size_t n) { item_count_ = n; }

        StageTimer(const StageTimer &) = delete;
        StageTimer &operator=(const StageTimer &) = delete;

    private:
        std::string label_;
        std::vector<StageTiming> &out_;
        Clock::time_point start_;
        size_t item_count_ = 0;
    };

    // Fixed-width table, one row per stage plus a total.
    inline std::string format_stage_report(const std::vector<StageTiming> &timings)
    {
        std::ostringstream oss;
        oss << "╔══════════════════╦══════════════╦══════════════╦══════════════╗\n"
            << "║ Stage            ║ Duration(ms) ║         Rows ║     Rows/sec ║\n"
            << "╠══════════════════╬══════════════╬══════════════╬══════════════╣\n";

        long long total_ns = 0;
        for (const auto &t : timings)
        {
            total_ns += t.duration_ns;
            oss << "║ " << std::left << std::setw(16) << t.label
                << " ║ " << std::right << std::fixed << std::setprecision(3) << std::setw(12) << t.duration_ms()
                << " ║ " << std::setw(12) << t.item_count
                << " ║ " << std::setprecision(0) << std::setw(12) << t.items_per_second()
                << " ║\n";
        }

        oss << "╠══════════════════╬══════════════╬══════════════╬══════════════╣\n"
            << "║ " << std::left << std::setw(16) << "TOTAL"
            << " ║ " << std::right << std::fixed << std::setprecision(3) << std::setw(12)
            << static_cast<double>(total_ns) / 1'000'000.0
            << " ║              ║              ║\n"
            << "╚══════════════════╩══════════════╩══════════════╩══════════════╝\n";
        return oss.str();
    }

} // namespace AisLake
