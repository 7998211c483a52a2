#include "PipelineConfig.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include "../model/PipelineErrors.hpp"

namespace AisLake
{

    namespace
    {
        std::string lowercase(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string trim(std::string_view s)
        {
            const auto first = s.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos)
                return {};
            const auto last = s.find_last_not_of(" \t\r\n");
            return std::string(s.substr(first, last - first + 1));
        }

        bool parse_bool(const std::string &name, const std::string &value)
        {
            const auto v = lowercase(trim(value));
            if (v == "1" || v == "true" || v == "yes" || v == "on")
                return true;
            if (v == "0" || v == "false" || v == "no" || v == "off" || v.empty())
                return false;
            throw ConfigError("[CONFIG ERROR] " + name + ": expected true/false, got '" + value + "'");
        }

        size_t parse_count(const std::string &name, const std::string &value)
        {
            const auto v = trim(value);
            size_t out = 0;
            auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
            if (v.empty() || ec != std::errc{} || ptr != v.data() + v.size())
                throw ConfigError("[CONFIG ERROR] " + name + ": expected a whole number, got '" + value + "'");
            return out;
        }

        double parse_seconds(const std::string &name, const std::string &value)
        {
            const auto v = trim(value);
            double out = 0.0;
            auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
            if (v.empty() || ec != std::errc{} || ptr != v.data() + v.size() || out <= 0.0)
                throw ConfigError("[CONFIG ERROR] " + name + ": expected seconds > 0, got '" + value + "'");
            return out;
        }

        LogLevel parse_level(const std::string &name, const std::string &value)
        {
            LogLevel level{};
            if (!parse_log_level(trim(value), level))
                throw ConfigError("[CONFIG ERROR] " + name + ": expected debug/info/warn/error, got '" + value + "'");
            return level;
        }
    } // namespace

    EnvLookup process_environment()
    {
        return [](const std::string &name) -> std::optional<std::string>
        {
            const char *value = std::getenv(name.c_str());
            if (value == nullptr)
                return std::nullopt;
            return std::string(value);
        };
    }

    PipelineConfig PipelineConfig::from_environment(const EnvLookup &env)
    {
        PipelineConfig config;

        if (auto v = env("AISLAKE_OUTPUT_ROOT"))
            config.output_root = *v;
        if (auto v = env("AISLAKE_PREFIX"))
            config.file_prefix = *v;
        if (auto v = env("AISLAKE_CHUNK_ROWS"))
            config.chunk_rows = parse_count("AISLAKE_CHUNK_ROWS", *v);
        if (auto v = env("AISLAKE_WORKERS"))
            config.worker_count = parse_count("AISLAKE_WORKERS", *v);
        if (auto v = env("AISLAKE_SKIP_MALFORMED"))
            config.skip_malformed = parse_bool("AISLAKE_SKIP_MALFORMED", *v);
        if (auto v = env("AISLAKE_DEDUP"))
            config.dedup_on_merge = parse_bool("AISLAKE_DEDUP", *v);
        if (auto v = env("AISLAKE_LOG_LEVEL"))
            config.log_level = parse_level("AISLAKE_LOG_LEVEL", *v);

        // Unprefixed names, shared with existing deployment .env files.
        if (auto v = env("ENABLE_S3_UPLOAD"))
            config.enable_upload = parse_bool("ENABLE_S3_UPLOAD", *v);
        if (auto v = env("S3_ENDPOINT"))
            config.s3.endpoint = trim(*v);
        if (auto v = env("S3_REGION"))
            config.s3.region = trim(*v);
        if (auto v = env("S3_ACCESS_KEY"))
            config.s3.access_key = trim(*v);
        if (auto v = env("S3_SECRET_KEY"))
            config.s3.secret_key = trim(*v);
        if (auto v = env("S3_BUCKET_NAME"))
            config.s3.bucket = trim(*v);
        if (auto v = env("S3_CONNECT_TIMEOUT"))
            config.s3.connect_timeout_s = parse_seconds("S3_CONNECT_TIMEOUT", *v);
        if (auto v = env("S3_REQUEST_TIMEOUT"))
            config.s3.request_timeout_s = parse_seconds("S3_REQUEST_TIMEOUT", *v);

        return config;
    }

    void PipelineConfig::validate() const
    {
        if (chunk_rows == 0)
            throw ConfigError("[CONFIG ERROR] chunk rows must be at least 1");
        if (worker_count == 0)
            throw ConfigError("[CONFIG ERROR] worker count must be at least 1");
        if (output_root.empty())
            throw ConfigError("[CONFIG ERROR] output root is empty");
        if (file_prefix.empty() || file_prefix.find('/') != std::string::npos)
            throw ConfigError("[CONFIG ERROR] file prefix must be a non-empty name without '/'");

        if (!enable_upload)
            return;

        // Upload was asked for explicitly: refuse to half-configure it.
        if (s3.bucket.empty())
            throw ConfigError("[CONFIG ERROR] upload enabled but S3_BUCKET_NAME is not set");
        if (s3.endpoint.empty() && s3.region.empty())
            throw ConfigError("[CONFIG ERROR] upload enabled but neither S3_ENDPOINT nor S3_REGION is set");
        if (s3.access_key.empty() || s3.secret_key.empty())
            throw ConfigError("[CONFIG ERROR] upload enabled but S3_ACCESS_KEY / S3_SECRET_KEY are not set");
    }

    std::map<std::string, std::string> parse_env_file(const std::filesystem::path &path)
    {
        std::map<std::string, std::string> entries;

        std::ifstream file(path);
        if (!file.is_open())
            throw ConfigError("[CONFIG ERROR] Cannot read env file " + path.string());

        std::string line;
        while (std::getline(file, line))
        {
            auto text = trim(line);
            if (text.empty() || text.front() == '#')
                continue;
            if (text.starts_with("export "))
                text = trim(std::string_view(text).substr(7));

            const auto eq = text.find('=');
            if (eq == std::string::npos || eq == 0)
                continue;

            auto key = trim(std::string_view(text).substr(0, eq));
            auto value = trim(std::string_view(text).substr(eq + 1));
            if (value.size() >= 2 &&
                (value.front() == '"' || value.front() == '\'') &&
                value.back() == value.front())
            {
                value = value.substr(1, value.size() - 2);
            }
            entries[key] = value;
        }

        if (file.bad())
            throw ConfigError("[CONFIG ERROR] Error while reading env file " + path.string());
        return entries;
    }

    size_t apply_env_file(const std::map<std::string, std::string> &entries)
    {
        size_t added = 0;
        for (const auto &[key, value] : entries)
        {
            if (std::getenv(key.c_str()) != nullptr)
                continue;
            if (::setenv(key.c_str(), value.c_str(), /*overwrite=*/0) != 0)
                throw ConfigError("[CONFIG ERROR] setenv failed for " + key);
            ++added;
        }
        return added;
    }

    std::optional<std::filesystem::path> find_env_file_flag(const std::vector<std::string> &args)
    {
        for (size_t i = 0; i < args.size(); ++i)
        {
            if (args[i] == "--env-file")
            {
                if (i + 1 >= args.size())
                    throw ConfigError("[CONFIG ERROR] --env-file needs a value");
                return std::filesystem::path(args[i + 1]);
            }
            if (args[i].starts_with("--env-file="))
                return std::filesystem::path(args[i].substr(11));
        }
        return std::nullopt;
    }

    // =========================================================================
    // apply_arguments
    // =========================================================================
    // Accepts both "--flag value" and "--flag=value". "--" ends flag parsing
    // so a CSV whose name starts with "--" can still be passed.
    // =========================================================================
    CliAction apply_arguments(const std::vector<std::string> &args, PipelineConfig &config)
    {
        bool flags_done = false;

        for (size_t i = 0; i < args.size(); ++i)
        {
            const std::string &arg = args[i];

            if (flags_done || !arg.starts_with("--"))
            {
                config.inputs.emplace_back(arg);
                continue;
            }
            if (arg == "--")
            {
                flags_done = true;
                continue;
            }

            std::string name = arg;
            std::optional<std::string> inline_value;
            if (const auto eq = arg.find('='); eq != std::string::npos)
            {
                name = arg.substr(0, eq);
                inline_value = arg.substr(eq + 1);
            }

            auto value = [&]() -> std::string
            {
                if (inline_value)
                    return *inline_value;
                if (i + 1 >= args.size())
                    throw ConfigError("[CONFIG ERROR] " + name + " needs a value");
                return args[++i];
            };

            // Switches take no separate value, but "--dedup=false" must not
            // switch the option on.
            auto switch_value = [&]() -> bool
            {
                return inline_value ? parse_bool(name, *inline_value) : true;
            };

            if (name == "--help" || name == "-h")
                return CliAction::ShowHelp;
            else if (name == "--output-root")
                config.output_root = value();
            else if (name == "--prefix")
                config.file_prefix = value();
            else if (name == "--chunk-rows")
                config.chunk_rows = parse_count(name, value());
            else if (name == "--workers")
                config.worker_count = parse_count(name, value());
            else if (name == "--upload")
                config.enable_upload = switch_value();
            else if (name == "--no-upload")
                config.enable_upload = !switch_value();
            else if (name == "--skip-malformed")
                config.skip_malformed = switch_value();
            else if (name == "--dedup")
                config.dedup_on_merge = switch_value();
            else if (name == "--log-level")
                config.log_level = parse_level(name, value());
            else if (name == "--env-file")
                (void)value(); // consumed before the environment layer
            else
                throw ConfigError("[CONFIG ERROR] Unknown option " + name);
        }

        return CliAction::Run;
    }

    std::string usage_text(const std::string &program)
    {
        std::ostringstream oss;
        oss << "Usage: " << program << " [options] <file.csv>...\n"
            << "\n"
            << "Splits AIS CSV files into hourly Parquet artifacts under the output root,\n"
            << "merging with artifacts from earlier runs.\n"
            << "\n"
            << "Options:\n"
            << "  --output-root DIR    artifact tree root            (AISLAKE_OUTPUT_ROOT, default .)\n"
            << "  --prefix NAME        artifact file name prefix     (AISLAKE_PREFIX, default AIS)\n"
            << "  --chunk-rows N       rows per read batch           (AISLAKE_CHUNK_ROWS, default 1000000)\n"
            << "  --workers N          parallel partition writers    (AISLAKE_WORKERS, default 4)\n"
            << "  --skip-malformed     skip rows with a bad BaseDateTime instead of failing\n"
            << "  --dedup              drop rows already stored (same MMSI + BaseDateTime)\n"
            << "  --upload/--no-upload push artifacts to S3, delete local after verification\n"
            << "                       (ENABLE_S3_UPLOAD, S3_ENDPOINT, S3_REGION, S3_ACCESS_KEY,\n"
            << "                        S3_SECRET_KEY, S3_BUCKET_NAME)\n"
            << "  --log-level LEVEL    debug | info | warn | error   (AISLAKE_LOG_LEVEL)\n"
            << "  --env-file PATH      load variables from PATH      (default ./.env if present)\n"
            << "  --help               show this text\n";
        return oss.str();
    }

} // namespace AisLake
