#pragma once

#include <memory>
#include <string>

namespace arrow::fs
{
    class FileSystem;
}

namespace AisLake
{

    struct S3Settings;

    // Owns Arrow's process-wide AWS SDK state for the lifetime of the object.
    // Create one in main() before any S3FileSystem, destroy it after the last
    // one is gone.
    class S3Session
    {
    public:
        S3Session();
        ~S3Session();

        S3Session(const S3Session &) = delete;
        S3Session &operator=(const S3Session &) = delete;
    };

    // Builds an S3-compatible filesystem (AWS, DigitalOcean Spaces, MinIO...)
    // from the settings. Timeouts bound every request so a hung connection
    // cannot park a worker forever. Throws ConfigError on failure.
    [[nodiscard]]
    std::shared_ptr<arrow::fs::FileSystem> make_s3_filesystem(const S3Settings &settings);

} // namespace AisLake
