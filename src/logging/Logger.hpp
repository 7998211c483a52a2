#pragma once

// ============================================================================
// Logger: timestamped, levelled log lines on stdout/stderr
// ============================================================================
//
// Usage:
//   log_info("PARQUET") << "Saved " << n << " rows to " << path;
//
// log_info() returns a LogLine by value. The LogLine collects everything
// streamed into it and writes ONE complete line when it is destroyed at the
// end of the full expression. Partition tasks log from pool workers, so
// lines are emitted under a mutex and never interleave mid-line.
//
// Output format:
//   2024-01-15T03:22:10.123Z [INFO ] [PARQUET] Saved 1200 rows to ...
//
// DEBUG/INFO go to std::cout, WARN/ERROR to std::cerr.
// ============================================================================

#include <sstream>
#include <string>
#include <string_view>

namespace AisLake
{

    enum class LogLevel
    {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3
    };

    // Lines below this level are dropped. Default: Info.
    void set_log_level(LogLevel level);
    LogLevel log_level();

    // "debug" | "info" | "warn" | "error" (case-insensitive).
    // Returns false and leaves 'out' untouched for anything else.
    bool parse_log_level(std::string_view text, LogLevel &out);

    // Writes one formatted line. Thread-safe.
    void write_log_line(LogLevel level, std::string_view tag, std::string_view message);

    class LogLine
    {
    public:
        LogLine(LogLevel level, std::string_view tag)
            : level_(level), tag_(tag), enabled_(level >= log_level())
        {
        }

        ~LogLine()
        {
            if (enabled_)
                write_log_line(level_, tag_, stream_.str());
        }

        template <typename T>
        LogLine &operator<<(const T &value)
        {
            if (enabled_)
                stream_ << value;
            return *this;
        }

        LogLine(const LogLine &) = delete;
        LogLine &operator=(const LogLine &) = delete;

    private:
        LogLevel level_;
        std::string tag_;
        bool enabled_;
        std::ostringstream stream_;
    };

    inline LogLine log_debug(std::string_view tag) { return LogLine(LogLevel::Debug, tag); }
    inline LogLine log_info(std::string_view tag) { return LogLine(LogLevel::Info, tag); }
    inline LogLine log_warn(std::string_view tag) { return LogLine(LogLevel::Warn, tag); }
    inline LogLine log_error(std::string_view tag) { return LogLine(LogLevel::Error, tag); }

} // namespace AisLake
