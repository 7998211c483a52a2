#pragma once

// ============================================================================
// AisDataGenerator: synthetic NOAA-style AIS CSV for tests and load runs
// ============================================================================
//
// Produces the 17-column NOAA layout with a realistic mix of content:
//   - a fleet of vessels, each reporting repeatedly and drifting in position
//   - timestamps increasing across [start, start + span), so the file
//     covers span/3600 hourly partitions
//   - missing values in the columns that are often empty in the real feed
//     (Heading, Status, Draft, IMO and Cargo are often blank)
//   - vessel names with commas, which forces quoted fields
//
// Same seed + options = byte-identical file. Tests rely on that.
// ============================================================================

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "../logging/Logger.hpp"

namespace AisLake
{

    struct GeneratorOptions
    {
        size_t rows = 100'000;
        uint64_t seed = 42;
        long long start_epoch_s = 1'705'276'800; // 2024-01-15T00:00:00Z
        long long span_s = 3 * 3600;             // three hourly partitions
        size_t vessels = 200;
        // Every Nth row gets an unparseable BaseDateTime. 0 = never.
        size_t malformed_every = 0;
    };

    class AisDataGenerator
    {
    public:
        // "2024-01-15T03:22:10" for a UTC epoch second.
        static std::string format_timestamp(long long epoch_s)
        {
            using namespace std::chrono;
            const sys_seconds tp{seconds{epoch_s}};
            const auto day = floor<days>(tp);
            const year_month_day ymd{day};
            const hh_mm_ss hms{tp - day};

            std::ostringstream oss;
            oss << std::setfill('0')
                << std::setw(4) << static_cast<int>(ymd.year()) << '-'
                << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
                << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
                << std::setw(2) << hms.hours().count() << ':'
                << std::setw(2) << hms.minutes().count() << ':'
                << std::setw(2) << hms.seconds().count();
            return oss.str();
        }

        // Returns the number of data rows written.
        static size_t generate(const std::filesystem::path &output_path,
                               const GeneratorOptions &options = {})
        {
            if (options.vessels == 0)
                throw std::invalid_argument("[GENERATOR] vessels must be at least 1");
            if (options.span_s <= 0)
                throw std::invalid_argument("[GENERATOR] span must be positive");

            log_info("GENERATOR") << "Generating " << options.rows << " AIS rows, seed "
                                  << options.seed;

            std::mt19937_64 rng(options.seed);
            std::uniform_real_distribution<double> lat_dist(24.0, 48.0);
            std::uniform_real_distribution<double> lon_dist(-125.0, -70.0);
            std::normal_distribution<double> drift(0.0, 0.002);
            std::uniform_real_distribution<double> sog_dist(0.0, 22.0);
            std::uniform_real_distribution<double> cog_dist(0.0, 359.9);
            std::uniform_int_distribution<int> percent(0, 99);

            struct Vessel
            {
                std::string mmsi;
                std::string name;
                std::string imo;
                std::string call_sign;
                int vessel_type;
                double length;
                double width;
                char transceiver_class;
                double lat;
                double lon;
            };

            std::vector<Vessel> fleet;
            fleet.reserve(options.vessels);
            static const char *kTypes[] = {"TUG", "CARGO", "TANKER", "FISHING", "PLEASURE"};
            for (size_t v = 0; v < options.vessels; ++v)
            {
                Vessel vessel;
                vessel.mmsi = std::to_string(366'000'000 + v * 37);
                vessel.name = std::string(kTypes[v % 5]) + " " + std::to_string(v);
                if (v % 7 == 0)
                    vessel.name += ", JR"; // forces a quoted field
                vessel.imo = (v % 3 == 0) ? "" : "IMO" + std::to_string(9'000'000 + v);
                vessel.call_sign = "W" + std::to_string(1000 + v);
                vessel.vessel_type = 30 + static_cast<int>(v % 60);
                vessel.length = 10.0 + static_cast<double>(v % 300);
                vessel.width = 3.0 + static_cast<double>(v % 45);
                vessel.transceiver_class = (v % 4 == 0) ? 'B' : 'A';
                vessel.lat = lat_dist(rng);
                vessel.lon = lon_dist(rng);
                fleet.push_back(std::move(vessel));
            }

            std::ofstream file(output_path, std::ios::binary);
            if (!file.is_open())
                throw std::runtime_error("[GENERATOR] Cannot create file: " + output_path.string());

            file << "MMSI,BaseDateTime,LAT,LON,SOG,COG,Heading,VesselName,IMO,CallSign,"
                    "VesselType,Status,Length,Width,Draft,Cargo,TransceiverClass\n";

            for (size_t i = 0; i < options.rows; ++i)
            {
                Vessel &vessel = fleet[i % fleet.size()];
                vessel.lat += drift(rng);
                vessel.lon += drift(rng);

                // Spread rows evenly over the span, in non-decreasing order.
                const long long offset = static_cast<long long>(
                    (static_cast<long double>(i) * options.span_s) / static_cast<long double>(options.rows));

                const bool malformed = options.malformed_every != 0 &&
                                       (i + 1) % options.malformed_every == 0;
                const bool no_heading = percent(rng) < 30;
                const bool no_draft = percent(rng) < 40;
                const bool no_status = percent(rng) < 10;

                file << vessel.mmsi << ','
                     << (malformed ? std::string("not-a-time")
                                   : format_timestamp(options.start_epoch_s + offset))
                     << ','
                     << std::fixed << std::setprecision(5) << vessel.lat << ','
                     << vessel.lon << ','
                     << std::setprecision(1) << sog_dist(rng) << ','
                     << cog_dist(rng) << ',';
                if (!no_heading)
                    file << static_cast<int>(cog_dist(rng));
                file << ',';
                if (vessel.name.find(',') != std::string::npos)
                    file << '"' << vessel.name << '"';
                else
                    file << vessel.name;
                file << ',' << vessel.imo << ',' << vessel.call_sign << ','
                     << vessel.vessel_type << ',';
                if (!no_status)
                    file << (i % 16);
                file << ',' << std::setprecision(1) << vessel.length << ','
                     << vessel.width << ',';
                if (!no_draft)
                    file << std::setprecision(1) << (2.0 + vessel.width / 5.0);
                file << ',' << ((i % 5 == 0) ? "70" : "") << ','
                     << vessel.transceiver_class << '\n';
            }

            file.flush();
            if (!file)
                throw std::runtime_error("[GENERATOR] Write failed: " + output_path.string());

            log_info("GENERATOR") << "Wrote " << options.rows << " rows to " << output_path;
            return options.rows;
        }
    };

} // namespace AisLake
