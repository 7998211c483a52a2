#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/PipelineConfig.hpp"
#include "logging/Logger.hpp"
#include "model/PipelineErrors.hpp"
#include "pipeline/IngestPipeline.hpp"
#include "storage/RemoteStore.hpp"
#include "storage/UploadVerifier.hpp"

// Exit codes
//   0  every input ingested, every partition succeeded
//   2  all inputs were read, but some partitions failed (see summary)
//   1  fatal: bad configuration, unreadable input, locked output tree
namespace
{
    constexpr int kExitOk = 0;
    constexpr int kExitFatal = 1;
    constexpr int kExitPartial = 2;

    AisLake::PipelineConfig load_config(const std::vector<std::string> &args,
                                        AisLake::CliAction &action)
    {
        using namespace AisLake;

        // .env seeds the environment; explicitly set variables win.
        if (auto env_file = find_env_file_flag(args))
        {
            const size_t added = apply_env_file(parse_env_file(*env_file));
            log_debug("CONFIG") << "Loaded " << added << " variable(s) from " << *env_file;
        }
        else if (std::filesystem::exists(".env"))
        {
            const size_t added = apply_env_file(parse_env_file(".env"));
            log_debug("CONFIG") << "Loaded " << added << " variable(s) from ./.env";
        }

        PipelineConfig config = PipelineConfig::from_environment(process_environment());
        action = apply_arguments(args, config);
        return config;
    }
}

int main(int argc, char *argv[])
{
    using namespace AisLake;

    std::ios_base::sync_with_stdio(false);
    const std::string program = argc > 0 ? argv[0] : "aislake_ingest";
    const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    PipelineConfig config;
    try
    {
        CliAction action = CliAction::Run;
        config = load_config(args, action);
        if (action == CliAction::ShowHelp)
        {
            std::cout << usage_text(program);
            return kExitOk;
        }
        config.validate();
    }
    catch (const ConfigError &e)
    {
        std::cerr << e.what() << "\n\n"
                  << usage_text(program);
        return kExitFatal;
    }

    if (config.inputs.empty())
    {
        std::cerr << usage_text(program);
        return kExitFatal;
    }

    set_log_level(config.log_level);

    // Declaration order matters: the session must outlive every S3 client.
    std::optional<S3Session> s3_session;
    std::unique_ptr<UploadVerifier> verifier;

    size_t total_read = 0;
    size_t total_appended = 0;
    size_t total_failed_partitions = 0;
    size_t fatal_inputs = 0;

    try
    {
        if (config.enable_upload)
        {
            s3_session.emplace();
            verifier = std::make_unique<UploadVerifier>(make_s3_filesystem(config.s3),
                                                        config.s3.bucket, config.output_root);
        }
        else
        {
            log_info("MAIN") << "Upload disabled, artifacts stay under " << config.output_root;
        }

        IngestPipeline pipeline(config, verifier.get());

        for (const auto &input : config.inputs)
        {
            try
            {
                const RunSummary summary = pipeline.ingest_file(input);
                std::cout << format_run_summary(summary);

                total_read += summary.rows_read;
                total_appended += summary.rows_appended;
                total_failed_partitions += summary.partitions_failed;
            }
            catch (const OutputTreeBusy &e)
            {
                // Another process owns the tree; every further input would fail the same way.
                log_error("MAIN") << e.what();
                ++fatal_inputs;
                break;
            }
            catch (const PipelineError &e)
            {
                log_error("MAIN") << "Run for " << input << " aborted: " << e.what();
                ++fatal_inputs;
            }
        }
    }
    catch (const std::exception &e)
    {
        log_error("MAIN") << "Pipeline crashed: " << e.what();
        return kExitFatal;
    }

    log_info("MAIN") << config.inputs.size() << " input(s): " << total_read << " rows read, "
                     << total_appended << " rows appended, " << total_failed_partitions
                     << " failed partition(s), " << fatal_inputs << " aborted input(s)";

    if (fatal_inputs > 0)
        return kExitFatal;
    if (total_failed_partitions > 0)
        return kExitPartial;
    return kExitOk;
}
