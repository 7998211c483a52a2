#include "Logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace AisLake
{

    namespace
    {
        std::atomic<LogLevel> g_level{LogLevel::Info};
        std::mutex g_output_mutex;

        const char *level_label(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::Debug:
                return "DEBUG";
            case LogLevel::Info:
                return "INFO ";
            case LogLevel::Warn:
                return "WARN ";
            case LogLevel::Error:
                return "ERROR";
            }
            return "?????";
        }

        // ISO-8601 UTC with milliseconds: 2024-01-15T03:22:10.123Z
        std::string utc_timestamp()
        {
            auto now = std::chrono::system_clock::now();
            auto time_t_now = std::chrono::system_clock::to_time_t(now);
            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                              now.time_since_epoch())
                              .count() %
                          1000;

            // gmtime_s / gmtime_r write into our buffer; std::gmtime() shares
            // a static one and is not safe with several workers logging.
            std::tm tm_now{};
#ifdef _WIN32
            gmtime_s(&tm_now, &time_t_now);
#else
            gmtime_r(&time_t_now, &tm_now);
#endif

            std::ostringstream oss;
            oss << std::put_time(&tm_now, "%Y-%m-%dT%H:%M:%S")
                << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
            return oss.str();
        }
    } // namespace

    void set_log_level(LogLevel level)
    {
        g_level.store(level);
    }

    LogLevel log_level()
    {
        return g_level.load();
    }

    bool parse_log_level(std::string_view text, LogLevel &out)
    {
        std::string lowered(text);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (lowered == "debug")
            out = LogLevel::Debug;
        else if (lowered == "info")
            out = LogLevel::Info;
        else if (lowered == "warn" || lowered == "warning")
            out = LogLevel::Warn;
        else if (lowered == "error")
            out = LogLevel::Error;
        else
            return false;
        return true;
    }

    void write_log_line(LogLevel level, std::string_view tag, std::string_view message)
    {
        // Format outside the lock, print inside it.
        std::string line = utc_timestamp();
        line += " [";
        line += level_label(level);
        line += "] [";
        line += tag;
        line += "] ";
        line += message;
        line += '\n';

        std::lock_guard<std::mutex> lock(g_output_mutex);
        if (level >= LogLevel::Warn)
        {
            std::cerr << line;
            std::cerr.flush();
        }
        else
        {
            std::cout << line;
        }
    }

} // namespace AisLake
