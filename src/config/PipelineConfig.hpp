#pragma once

// ============================================================================
// PipelineConfig: every knob of a run, as one explicit value
// ============================================================================
// Built in layers, later layers win:
//
//   1. defaults (below)
//   2. environment variables, optionally seeded from a .env file
//      (a .env entry never overrides a variable that is already set)
//   3. command-line flags
//
// The finished value is passed by const reference into each component's
// constructor. Nothing reads the environment after startup.
// ============================================================================

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "../logging/Logger.hpp"

namespace AisLake
{

    struct S3Settings
    {
        std::string endpoint; // "https://sfo3.digitaloceanspaces.com"; empty = AWS
        std::string region;
        std::string access_key;
        std::string secret_key;
        std::string bucket;
        double connect_timeout_s = 10.0;
        double request_timeout_s = 120.0;
    };

    // Looks a variable up; nullopt if unset. Injected so tests need not
    // touch the real process environment.
    using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

    struct PipelineConfig
    {
        std::filesystem::path output_root = ".";
        std::string file_prefix = "AIS";
        size_t chunk_rows = 1'000'000;
        size_t worker_count = 4;
        bool enable_upload = false;
        bool skip_malformed = false;
        bool dedup_on_merge = false;
        LogLevel log_level = LogLevel::Info;
        S3Settings s3;

        // CSV files to ingest, in order. Each one is a separate run.
        std::vector<std::filesystem::path> inputs;

        // Layer 2. Throws ConfigError on unparseable values.
        [[nodiscard]]
        static PipelineConfig from_environment(const EnvLookup &env);

        // Throws ConfigError describing the first problem found.
        void validate() const;
    };

    enum class CliAction
    {
        Run,
        ShowHelp
    };

    // Process environment via std::getenv.
    EnvLookup process_environment();

    // KEY=VALUE lines; '#' comments, blank lines and an "export " prefix are
    // allowed; single or double quotes around VALUE are stripped.
    // Throws ConfigError if the file exists but cannot be read.
    [[nodiscard]]
    std::map<std::string, std::string> parse_env_file(const std::filesystem::path &path);

    // setenv() each entry unless the variable is already set.
    // Returns how many variables were added.
    size_t apply_env_file(const std::map<std::string, std::string> &entries);

    // Value of --env-file if present in args, else nullopt.
    [[nodiscard]]
    std::optional<std::filesystem::path> find_env_file_flag(const std::vector<std::string> &args);

    // Layer 3. 'args' excludes argv[0]. Non-flag arguments are inputs.
    // Throws ConfigError for unknown flags or bad values.
    CliAction apply_arguments(const std::vector<std::string> &args, PipelineConfig &config);

    [[nodiscard]]
    std::string usage_text(const std::string &program);

} // namespace AisLake
