#include "RemoteStore.hpp"

#include <arrow/filesystem/s3fs.h>

#include "../config/PipelineConfig.hpp"
#include "../logging/Logger.hpp"
#include "../model/PipelineErrors.hpp"
#include "../output/ArrowCheck.hpp"

namespace AisLake
{

    S3Session::S3Session()
    {
        auto status = arrow::fs::EnsureS3Initialized();
        if (!status.ok())
            throw ConfigError("[S3 ERROR] Cannot initialize S3 support: " + status.ToString());
    }

    S3Session::~S3Session()
    {
        auto status = arrow::fs::FinalizeS3();
        if (!status.ok())
            log_warn("S3") << "FinalizeS3 failed: " << status.ToString();
    }

    std::shared_ptr<arrow::fs::FileSystem> make_s3_filesystem(const S3Settings &settings)
    {
        auto options = arrow::fs::S3Options::FromAccessKey(settings.access_key, settings.secret_key);
        options.region = settings.region;

        // "https://sfo3.digitaloceanspaces.com" -> scheme + host
        std::string endpoint = settings.endpoint;
        if (endpoint.starts_with("https://"))
        {
            options.scheme = "https";
            endpoint.erase(0, 8);
        }
        else if (endpoint.starts_with("http://"))
        {
            options.scheme = "http";
            endpoint.erase(0, 7);
        }
        while (!endpoint.empty() && endpoint.back() == '/')
            endpoint.pop_back();
        options.endpoint_override = endpoint;

        options.connect_timeout = settings.connect_timeout_s;
        options.request_timeout = settings.request_timeout_s;

        auto fs = value_or_throw<ConfigError>(
            arrow::fs::S3FileSystem::Make(options),
            "[S3 ERROR] Cannot create S3 client for endpoint '" + settings.endpoint + "'");

        log_info("S3") << "Remote storage: bucket " << settings.bucket << " at "
                       << (settings.endpoint.empty() ? "AWS default endpoint" : settings.endpoint)
                       << " (region " << settings.region << ")";
        return fs;
    }

} // namespace AisLake
