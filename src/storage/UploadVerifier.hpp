#pragma once

// ============================================================================
// UploadVerifier: push an artifact to object storage, prove it, then free disk
// ============================================================================
//
//   local file ──put──► bucket/key ──head──► exists, same size?
//                                              │ yes          │ no / error
//                                              ▼              ▼
//                                        delete local    keep local
//
// RULE: a local artifact is deleted if and only if an independent existence
// probe has confirmed the remote copy. A successful put alone is not
// enough: with eventually-consistent or flaky stores the put can "succeed"
// and the object still be missing. Keeping the local file costs disk space;
// deleting it wrongly costs data.
//
// The remote side is any arrow::fs::FileSystem. Production passes an
// S3FileSystem (see RemoteStore.hpp); tests pass a local filesystem.
// Paths on it are "bucket/key", key = artifact path relative to the
// output root with '/' separators, e.g.
//   noaa-ais-data/year=2024/month=01/day=15/hour=03/AIS_2024_01_15_processed_hour03.parquet
//
// The same mapping is used in reverse by restore(): when a previous run
// uploaded (and deleted) an hour, the next run pulls it back before merging
// so merge-on-write sees the remote rows too.
// ============================================================================

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace arrow::fs
{
    class FileSystem;
}

namespace AisLake
{

    struct UploadResult
    {
        std::string remote_path; // bucket/key
        int64_t bytes = 0;
        bool local_deleted = false;
    };

    class UploadVerifier
    {
    public:
        // Bytes per read/write when streaming a file to or from the store.
        static constexpr int64_t kTransferChunk = 4 << 20; // 4 MiB

        UploadVerifier(std::shared_ptr<arrow::fs::FileSystem> remote,
                       std::string bucket,
                       std::filesystem::path output_root);

        // Object key for a local artifact: path relative to the output root.
        // Throws UploadError if the artifact is not under the output root.
        [[nodiscard]]
        std::string object_key(const std::filesystem::path &artifact) const;

        // "bucket/key"
        [[nodiscard]]
        std::string remote_path(const std::filesystem::path &artifact) const;

        /**
         * @brief Upload, probe, and on confirmation delete the local file.
         * @throws UploadError        transmission failed; local file untouched
         * @throws VerificationError  probe failed or mismatched; local file kept
         */
        UploadResult upload(const std::filesystem::path &artifact) const;

        /**
         * @brief Downloads bucket/key to 'artifact' if the object exists.
         * @return true if a remote copy was found and written locally.
         * @throws UploadError if the store cannot be queried or the download
         *         fails. Callers must not overwrite the remote object then.
         */
        bool restore(const std::filesystem::path &artifact) const;

        const std::string &bucket() const { return bucket_; }

    private:
        std::shared_ptr<arrow::fs::FileSystem> remote_;
        std::string bucket_;
        std::filesystem::path output_root_;
    };

} // namespace AisLake
